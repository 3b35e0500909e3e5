# include <string>

# include <gmime/gmime.h>

# include "pgpmime.hh"
# include "decryptor.hh"
# include "message.hh"
# include "crypto.hh"
# include "utils/ustring_utils.hh"
# include "utils/date_utils.hh"

namespace PgpMime {
  DecryptResult::DecryptResult (Status _status, ustring _error) :
    status (_status), error (_error)
  {
  }

  bool DecryptResult::ok () const {
    return status == SUCCESS;
  }

  bool DecryptResult::is_validation_error () const {
    switch (status) {
      case NOT_PGP_MIME:
      case WRONG_PART_COUNT:
      case MALFORMED_CONTROL_PART:
      case UNSUPPORTED_VERSION:
      case MALFORMED_CONTENT_PART:
        return true;

      default:
        return false;
    }
  }

  ustring DecryptResult::status_string (Status s) {
    switch (s) {
      case SUCCESS:                return "success";
      case NOT_PGP_MIME:           return "not a PGP/MIME message";
      case WRONG_PART_COUNT:       return "wrong part count";
      case MALFORMED_CONTROL_PART: return "malformed control part";
      case UNSUPPORTED_VERSION:    return "unsupported version";
      case MALFORMED_CONTENT_PART: return "malformed content part";
      case BACKEND_ERROR:          return "decryption backend error";
      default:                     return "unknown";
    }
  }

  const char * const Decryptor::default_header = "X-Pgpmime-Decrypted";

  Decryptor::Decryptor () :
    Decryptor (default_header,
               ustring::compose ("pgpmime-decrypt/%1", PgpMime::version))
  {
  }

  Decryptor::Decryptor (ustring _header, ustring _agent) :
    header (_header), agent (_agent)
  {
  }

  DecryptResult Decryptor::decrypt (Message & message, Crypto & crypto, bool keep_original) {
    GMimeObject * mp = message.mime_part ();

    DecryptResult r = validate (mp);
    if (!r.ok ()) return r;

    GMimeMultipart * encrypted = GMIME_MULTIPART (mp);
    GMimePart * content = GMIME_PART (g_mime_multipart_get_part (encrypted, 1));

    /* the original has to be serialized before anything is changed */
    std::string original;
    if (keep_original) original = message.to_bytes (true);

    /* undo the content transfer encoding */
    GMimeStream * ciphertext = g_mime_stream_mem_new ();
    GMimeDataWrapper * wrapper = g_mime_part_get_content (content);
    if (wrapper != NULL) {
      if (g_mime_data_wrapper_write_to_stream (wrapper, ciphertext) == -1) {
        g_object_unref (ciphertext);
        return DecryptResult (DecryptResult::MALFORMED_CONTENT_PART,
            "malformed content part: could not decode content");
      }
    }
    g_mime_stream_reset (ciphertext);

    GMimeStream * plaintext = g_mime_stream_mem_new ();
    ustring error;

    bool success = crypto.decrypt (ciphertext, plaintext, error);
    g_object_unref (ciphertext);

    if (!success) {
      g_object_unref (plaintext);
      return DecryptResult (DecryptResult::BACKEND_ERROR, error);
    }

    g_mime_stream_reset (plaintext);

    /* the plaintext is a mime entity, usually the original multipart
     * body with its own content headers */
    GMimeParser * parser = g_mime_parser_new_with_stream (plaintext);
    GMimeObject * decrypted = g_mime_parser_construct_part (parser, g_mime_parser_options_get_default ());
    g_object_unref (parser);
    g_object_unref (plaintext);

    if (decrypted == NULL) {
      return DecryptResult (DecryptResult::BACKEND_ERROR,
          "decrypted content is not a MIME entity");
    }

    /* build the new body, keeping every parameter but protocol and
     * boundary, with a freshly generated boundary. */
    GMimeMultipart * mixed = g_mime_multipart_new_with_subtype ("mixed");
    g_mime_multipart_set_boundary (mixed, NULL);

    GMimeParamList * params = g_mime_content_type_get_parameters (
        g_mime_object_get_content_type (mp));

    for (int i = 0; i < g_mime_param_list_length (params); i++) {
      GMimeParam * p = g_mime_param_list_get_parameter_at (params, i);
      ustring name = ustring (g_mime_param_get_name (p)).lowercase ();

      if (name == "protocol" || name == "boundary") continue;

      g_mime_object_set_content_type_parameter (GMIME_OBJECT (mixed),
          g_mime_param_get_name (p), g_mime_param_get_value (p));
    }

    /* the other headers of the outer part (Content-Description,
     * Content-Disposition, ..) belong to the part, not the message */
    GMimeHeaderList * headers = g_mime_object_get_header_list (mp);

    for (int i = 0; i < g_mime_header_list_get_count (headers); i++) {
      GMimeHeader * h = g_mime_header_list_get_header_at (headers, i);
      const char * name  = g_mime_header_get_name (h);
      const char * value = g_mime_header_get_value (h);

      if (g_ascii_strcasecmp (name, "Content-Type") == 0) continue;

      g_mime_object_append_header (GMIME_OBJECT (mixed), name, value ? value : "", NULL);
    }

    g_mime_multipart_add (mixed, decrypted);
    g_object_unref (decrypted);

    if (keep_original) {
      GMimeObject * att = original_attachment (original);
      g_mime_multipart_add (mixed, att);
      g_object_unref (att);
    }

    /* swap */
    g_mime_message_set_mime_part (message.message, GMIME_OBJECT (mixed));
    g_object_unref (mixed);

    g_mime_object_append_header (GMIME_OBJECT (message.message),
        header.c_str (), processed_stamp ().c_str (), NULL);

    return DecryptResult ();
  }

  DecryptResult Decryptor::validate (GMimeObject * mp) {
    if (mp == NULL) {
      return DecryptResult (DecryptResult::NOT_PGP_MIME,
          "not a PGP/MIME encrypted message: message has no body");
    }

    GMimeContentType * ct = g_mime_object_get_content_type (mp);
    const char * protocol = g_mime_content_type_get_parameter (ct, "protocol");

    if (!g_mime_content_type_is_type (ct, "multipart", "encrypted") ||
        protocol == NULL ||
        ustring (protocol).lowercase () != "application/pgp-encrypted")
    {
      return DecryptResult (DecryptResult::NOT_PGP_MIME,
          ustring::compose ("not a PGP/MIME encrypted message (content type: %1, protocol: %2)",
            mime_type (mp), (protocol ? protocol : "none")));
    }

    int count = 0;
    if (GMIME_IS_MULTIPART (mp)) {
      count = g_mime_multipart_get_count (GMIME_MULTIPART (mp));
    }

    if (count != 2) {
      return DecryptResult (DecryptResult::WRONG_PART_COUNT,
          ustring::compose ("expected 2 parts, got %1", count));
    }

    GMimeObject * control = g_mime_multipart_get_part (GMIME_MULTIPART (mp), 0);

    if (!g_mime_content_type_is_type (g_mime_object_get_content_type (control),
          "application", "pgp-encrypted"))
    {
      return DecryptResult (DecryptResult::MALFORMED_CONTROL_PART,
          ustring::compose ("malformed control part: expected application/pgp-encrypted, got %1",
            mime_type (control)));
    }

    ustring version = control_version (control);
    if (version != "1") {
      return DecryptResult (DecryptResult::UNSUPPORTED_VERSION,
          ustring::compose ("unsupported PGP/MIME version: '%1'", version));
    }

    GMimeObject * content = g_mime_multipart_get_part (GMIME_MULTIPART (mp), 1);

    if (!g_mime_content_type_is_type (g_mime_object_get_content_type (content),
          "application", "octet-stream") || !GMIME_IS_PART (content))
    {
      return DecryptResult (DecryptResult::MALFORMED_CONTENT_PART,
          ustring::compose ("malformed content part: expected application/octet-stream, got %1",
            mime_type (content)));
    }

    return DecryptResult ();
  }

  ustring Decryptor::control_version (GMimeObject * control) {
    if (!GMIME_IS_PART (control)) return "";

    GMimeDataWrapper * wrapper = g_mime_part_get_content (GMIME_PART (control));
    if (wrapper == NULL) return "";

    GMimeStream * body = g_mime_stream_mem_new ();
    g_mime_data_wrapper_write_to_stream (wrapper, body);
    g_mime_stream_reset (body);

    /* the body is a header block: Version: 1 */
    GMimeParser * parser = g_mime_parser_new_with_stream (body);
    GMimeObject * block  = g_mime_parser_construct_part (parser, g_mime_parser_options_get_default ());
    g_object_unref (parser);
    g_object_unref (body);

    if (block == NULL) return "";

    const char * v = g_mime_object_get_header (block, "Version");
    ustring version = (v ? v : "");
    g_object_unref (block);

    UstringUtils::trim (version);

    return version;
  }

  GMimeObject * Decryptor::original_attachment (const std::string & original) {
    GMimePart * part = g_mime_part_new_with_type ("message", "rfc822");

    GMimeContentDisposition * disposition =
      g_mime_content_disposition_parse (NULL, "attachment; filename=original");
    g_mime_object_set_content_disposition (GMIME_OBJECT (part), disposition);
    g_object_unref (disposition);

    /* stored as is, without any transfer encoding */
    GMimeStream * stream = g_mime_stream_mem_new_with_buffer (original.data (), original.size ());
    GMimeDataWrapper * content = g_mime_data_wrapper_new_with_stream (stream, GMIME_CONTENT_ENCODING_DEFAULT);
    g_mime_part_set_content (part, content);

    g_object_unref (content);
    g_object_unref (stream);

    return GMIME_OBJECT (part);
  }

  ustring Decryptor::processed_stamp () {
    return ustring::compose ("%1; %2", agent, Date::iso8601_now ());
  }

  ustring Decryptor::mime_type (GMimeObject * o) {
    GMimeContentType * ct = g_mime_object_get_content_type (o);
    if (ct == NULL) return "";

    char * mt = g_mime_content_type_get_mime_type (ct);
    ustring t (mt);
    g_free (mt);

    return t.lowercase ();
  }
}

