# pragma once

# include <string>

# include <gmime/gmime.h>

# include "proto.hh"

namespace PgpMime {
  struct DecryptResult {
    enum Status {
      SUCCESS,

      /* structural validation, see RFC 3156 section 4 */
      NOT_PGP_MIME,
      WRONG_PART_COUNT,
      MALFORMED_CONTROL_PART,
      UNSUPPORTED_VERSION,
      MALFORMED_CONTENT_PART,

      BACKEND_ERROR,
    };

    DecryptResult (Status _status = SUCCESS, ustring _error = "");

    Status  status;
    ustring error;

    bool ok () const;
    bool is_validation_error () const;

    static ustring status_string (Status);
  };

  /* turns a multipart/encrypted PGP/MIME message into a multipart/mixed
   * message holding the decrypted entity, and optionally the original
   * message as a message/rfc822 attachment.
   *
   * the message is only modified when decryption succeeds. */
  class Decryptor {
    public:
      Decryptor ();
      Decryptor (ustring header, ustring agent);

      static const char * const default_header;

      /* name and value prefix of the header recording the decryption */
      ustring header;
      ustring agent;

      DecryptResult decrypt (Message & message, Crypto & crypto, bool keep_original);

    private:
      DecryptResult validate (GMimeObject * mime_part);

      ustring processed_stamp ();

      static ustring mime_type (GMimeObject *);
      static ustring control_version (GMimeObject * control);
      static GMimeObject * original_attachment (const std::string & original);
  };
}

