# define BOOST_TEST_DYN_LINK
# define BOOST_TEST_MODULE TestDecrypt
# include <boost/test/unit_test.hpp>

# include <memory>

# include "test_common.hh"
# include "decryptor.hh"

using PgpMime::Message;
using PgpMime::Decryptor;
using PgpMime::DecryptResult;

const std::string mail_dir = "tests/mail/";

/* runs the decryptor on a fixture that should be rejected and checks that
 * the message is left exactly as it was */
DecryptResult expect_rejected (std::string fname, DecryptResult::Status status) {
  std::unique_ptr<Message> m (new Message (mail_dir + fname));
  StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
  Decryptor d;

  std::string before = m->to_bytes ();
  DecryptResult r = d.decrypt (*m, crypto, true);

  BOOST_CHECK_MESSAGE (r.status == status, fname << ": got: " << DecryptResult::status_string (r.status) << ": " << r.error);
  BOOST_CHECK (r.is_validation_error ());
  BOOST_CHECK (!r.ok ());
  BOOST_CHECK (crypto.calls == 0);
  BOOST_CHECK (m->to_bytes () == before);

  return r;
}

BOOST_AUTO_TEST_SUITE(Decrypting)

  BOOST_AUTO_TEST_CASE(decrypt_without_original)
  {
    setup ();

    {
      Message m (mail_dir + "encrypted.eml");
      StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
      Decryptor d;

      DecryptResult r = d.decrypt (m, crypto, false);
      BOOST_REQUIRE_MESSAGE (r.ok (), r.error);
      BOOST_CHECK (crypto.calls == 1);
      BOOST_CHECK (crypto.ciphertext.find ("-----BEGIN PGP MESSAGE-----") != std::string::npos);

      BOOST_CHECK (m.content_type () == "multipart/mixed");

      GMimeObject * mp = m.mime_part ();
      BOOST_REQUIRE (GMIME_IS_MULTIPART (mp));
      BOOST_CHECK (g_mime_multipart_get_count (GMIME_MULTIPART (mp)) == 1);

      GMimeContentType * ct = g_mime_object_get_content_type (mp);
      BOOST_CHECK (g_mime_content_type_get_parameter (ct, "protocol") == NULL);

      /* the decrypted entity is the plaintext tree */
      GMimeObject * dec = g_mime_multipart_get_part (GMIME_MULTIPART (mp), 0);
      BOOST_CHECK (object_type (dec) == "multipart/mixed");
      BOOST_REQUIRE (GMIME_IS_MULTIPART (dec));
      BOOST_CHECK (g_mime_multipart_get_count (GMIME_MULTIPART (dec)) == 2);

      GMimeObject * text = g_mime_multipart_get_part (GMIME_MULTIPART (dec), 0);
      BOOST_CHECK (object_type (text) == "text/plain");
      BOOST_CHECK (part_content (text).find ("this is the secret") != std::string::npos);

      /* original headers survive */
      const char * subject = g_mime_object_get_header (GMIME_OBJECT (m.message), "Subject");
      BOOST_REQUIRE (subject != NULL);
      BOOST_CHECK (ustring (subject) == "encrypted message");
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(decrypt_keep_original)
  {
    setup ();

    {
      Message m (mail_dir + "encrypted.eml");
      StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
      Decryptor d;

      std::string original = m.to_bytes ();

      DecryptResult r = d.decrypt (m, crypto, true);
      BOOST_REQUIRE_MESSAGE (r.ok (), r.error);

      GMimeObject * mp = m.mime_part ();
      BOOST_REQUIRE (GMIME_IS_MULTIPART (mp));
      BOOST_REQUIRE (g_mime_multipart_get_count (GMIME_MULTIPART (mp)) == 2);

      GMimeObject * dec = g_mime_multipart_get_part (GMIME_MULTIPART (mp), 0);
      BOOST_CHECK (object_type (dec) == "multipart/mixed");

      GMimeObject * att = g_mime_multipart_get_part (GMIME_MULTIPART (mp), 1);
      BOOST_CHECK (object_type (att) == "message/rfc822");
      BOOST_CHECK (part_content (att) == original);

      GMimeContentDisposition * disp = g_mime_object_get_content_disposition (att);
      BOOST_REQUIRE (disp != NULL);
      BOOST_CHECK (g_mime_content_disposition_is_attachment (disp));
      BOOST_CHECK (ustring (g_mime_content_disposition_get_parameter (disp, "filename")) == "original");
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(decrypt_base64_content)
  {
    setup ();

    {
      Message m (mail_dir + "encrypted-base64.eml");
      StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
      Decryptor d;

      DecryptResult r = d.decrypt (m, crypto, false);
      BOOST_REQUIRE_MESSAGE (r.ok (), r.error);

      /* the backend gets the decoded armor, not base64 */
      BOOST_CHECK (crypto.ciphertext == read_file (mail_dir + "armor.asc"));
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(decrypt_processed_header)
  {
    setup ();

    {
      {
        Message m (mail_dir + "encrypted.eml");
        StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
        Decryptor d;

        BOOST_REQUIRE (d.decrypt (m, crypto, false).ok ());

        const char * h = g_mime_object_get_header (GMIME_OBJECT (m.message), Decryptor::default_header);
        BOOST_REQUIRE (h != NULL);
        BOOST_CHECK (ustring (h).find ("pgpmime-decrypt/") == 0);
      }

      {
        Message m (mail_dir + "encrypted.eml");
        StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
        Decryptor d ("X-Decrypted-By", "tester/1.0");

        BOOST_REQUIRE (d.decrypt (m, crypto, false).ok ());

        const char * h = g_mime_object_get_header (GMIME_OBJECT (m.message), "X-Decrypted-By");
        BOOST_REQUIRE (h != NULL);

        ustring v (h);
        BOOST_CHECK (v.find ("tester/1.0; ") == 0);

        /* timestamp: yyyy-mm-ddThh:mm:ss */
        auto re = Glib::Regex::create ("^tester/1\\.0; \\d{4}-\\d{2}-\\d{2}T\\d{2}:\\d{2}:\\d{2}");
        BOOST_CHECK (re->match (v));

        BOOST_CHECK (g_mime_object_get_header (GMIME_OBJECT (m.message), Decryptor::default_header) == NULL);
      }
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(decrypt_round_trip)
  {
    setup ();

    {
      Message m (mail_dir + "encrypted.eml");
      StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
      Decryptor d;

      BOOST_REQUIRE (d.decrypt (m, crypto, true).ok ());

      std::string out = m.to_bytes ();
      std::unique_ptr<Message> n (Message::from_bytes (out));

      BOOST_CHECK (n->content_type () == m.content_type ());

      GMimeObject * a = m.mime_part ();
      GMimeObject * b = n->mime_part ();
      BOOST_REQUIRE (GMIME_IS_MULTIPART (a));
      BOOST_REQUIRE (GMIME_IS_MULTIPART (b));

      int count = g_mime_multipart_get_count (GMIME_MULTIPART (a));
      BOOST_REQUIRE (count == g_mime_multipart_get_count (GMIME_MULTIPART (b)));

      for (int i = 0; i < count; i++) {
        BOOST_CHECK (object_type (g_mime_multipart_get_part (GMIME_MULTIPART (a), i)) ==
                     object_type (g_mime_multipart_get_part (GMIME_MULTIPART (b), i)));
      }

      /* same parameters, the boundary has been generated when written */
      GMimeParamList * pa = g_mime_content_type_get_parameters (g_mime_object_get_content_type (a));
      GMimeParamList * pb = g_mime_content_type_get_parameters (g_mime_object_get_content_type (b));
      BOOST_CHECK (g_mime_param_list_length (pa) == g_mime_param_list_length (pb));

      for (int i = 0; i < g_mime_param_list_length (pa); i++) {
        GMimeParam * p = g_mime_param_list_get_parameter_at (pa, i);
        const char * v = g_mime_content_type_get_parameter (
            g_mime_object_get_content_type (b), g_mime_param_get_name (p));

        BOOST_REQUIRE (v != NULL);
        BOOST_CHECK (ustring (v) == ustring (g_mime_param_get_value (p)));
      }

      BOOST_CHECK (g_mime_content_type_get_parameter (g_mime_object_get_content_type (b), "boundary") != NULL);
      BOOST_CHECK (g_mime_content_type_get_parameter (g_mime_object_get_content_type (b), "protocol") == NULL);

      const char * ha = g_mime_object_get_header (GMIME_OBJECT (m.message), Decryptor::default_header);
      const char * hb = g_mime_object_get_header (GMIME_OBJECT (n->message), Decryptor::default_header);
      BOOST_REQUIRE (ha != NULL);
      BOOST_REQUIRE (hb != NULL);
      BOOST_CHECK (ustring (ha) == ustring (hb));
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(decrypt_keeps_part_headers)
  {
    setup ();

    {
      Message m (mail_dir + "encrypted-described.eml");
      StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
      Decryptor d;

      BOOST_REQUIRE (d.decrypt (m, crypto, false).ok ());

      const char * desc = g_mime_object_get_header (m.mime_part (), "Content-Description");
      BOOST_REQUIRE (desc != NULL);
      BOOST_CHECK (ustring (desc) == "OpenPGP encrypted message");

      /* only one Content-Type, describing the new container */
      GMimeHeaderList * headers = g_mime_object_get_header_list (m.mime_part ());
      int types = 0;
      for (int i = 0; i < g_mime_header_list_get_count (headers); i++) {
        GMimeHeader * h = g_mime_header_list_get_header_at (headers, i);
        if (g_ascii_strcasecmp (g_mime_header_get_name (h), "Content-Type") == 0) types++;
      }
      BOOST_CHECK (types == 1);

      std::string out = m.to_bytes ();
      BOOST_CHECK (out.find ("Content-Description: OpenPGP encrypted message") != std::string::npos);

      std::unique_ptr<Message> n (Message::from_bytes (out));
      BOOST_CHECK (n->content_type () == "multipart/mixed");

      const char * ndesc = g_mime_object_get_header (n->mime_part (), "Content-Description");
      BOOST_REQUIRE (ndesc != NULL);
      BOOST_CHECK (ustring (ndesc) == "OpenPGP encrypted message");
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(decrypt_twice_fails)
  {
    setup ();

    {
      Message m (mail_dir + "encrypted.eml");
      StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
      Decryptor d;

      BOOST_REQUIRE (d.decrypt (m, crypto, false).ok ());

      std::string once = m.to_bytes ();

      DecryptResult r = d.decrypt (m, crypto, false);
      BOOST_CHECK (r.status == DecryptResult::NOT_PGP_MIME);
      BOOST_CHECK (crypto.calls == 1);
      BOOST_CHECK (m.to_bytes () == once);
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(decrypt_envelope)
  {
    setup ();

    {
      const std::string envelope = "From x@y 1 1 00:00:00 1970";

      Message m (mail_dir + "encrypted-envelope.eml");
      BOOST_CHECK (m.has_envelope ());
      BOOST_CHECK (m.envelope == envelope);

      std::string original = m.to_bytes (true);
      BOOST_CHECK (original.find (envelope + "\nFrom: Alice") == 0);

      StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
      Decryptor d;
      BOOST_REQUIRE (d.decrypt (m, crypto, true).ok ());

      std::string with    = m.to_bytes (true);
      std::string without = m.to_bytes (false);

      BOOST_CHECK (with.find (envelope + "\n") == 0);
      BOOST_CHECK (without.find ("From ") != 0);
      BOOST_CHECK (with.substr (envelope.size () + 1) == without);

      /* the kept original carries the envelope line too */
      GMimeObject * att = g_mime_multipart_get_part (GMIME_MULTIPART (m.mime_part ()), 1);
      BOOST_CHECK (part_content (att) == original);
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(decrypt_no_envelope)
  {
    setup ();

    {
      Message m (mail_dir + "encrypted.eml");
      BOOST_CHECK (!m.has_envelope ());

      StubCrypto crypto (read_file (mail_dir + "plaintext.eml"));
      Decryptor d;
      BOOST_REQUIRE (d.decrypt (m, crypto, false).ok ());

      BOOST_CHECK (m.to_bytes (true) == m.to_bytes (false));
      BOOST_CHECK (m.to_bytes (true).find ("From ") != 0);
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(backend_failure_leaves_message)
  {
    setup ();

    {
      Message m (mail_dir + "encrypted.eml");
      StubCrypto crypto ("");
      crypto.fail    = true;
      crypto.failure = "No secret key";

      Decryptor d;

      std::string before = m.to_bytes ();

      DecryptResult r = d.decrypt (m, crypto, true);
      BOOST_CHECK (r.status == DecryptResult::BACKEND_ERROR);
      BOOST_CHECK (!r.is_validation_error ());
      BOOST_CHECK (r.error == "No secret key");
      BOOST_CHECK (crypto.calls == 1);

      BOOST_CHECK (m.content_type () == "multipart/encrypted");
      BOOST_CHECK (m.to_bytes () == before);
      BOOST_CHECK (g_mime_object_get_header (GMIME_OBJECT (m.message), Decryptor::default_header) == NULL);
    }

    teardown ();
  }

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Validation)

  BOOST_AUTO_TEST_CASE(not_pgp_mime)
  {
    setup ();

    {
      expect_rejected ("plain.eml", DecryptResult::NOT_PGP_MIME);

      DecryptResult r = expect_rejected ("wrong-protocol.eml", DecryptResult::NOT_PGP_MIME);
      BOOST_CHECK (r.error.find ("application/pkcs7-mime") != ustring::npos);
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(wrong_part_count)
  {
    setup ();

    {
      DecryptResult r;

      r = expect_rejected ("zero-parts.eml", DecryptResult::WRONG_PART_COUNT);
      BOOST_CHECK_MESSAGE (r.error.find ("got 0") != ustring::npos, r.error);

      r = expect_rejected ("one-part.eml", DecryptResult::WRONG_PART_COUNT);
      BOOST_CHECK_MESSAGE (r.error.find ("got 1") != ustring::npos, r.error);

      r = expect_rejected ("three-parts.eml", DecryptResult::WRONG_PART_COUNT);
      BOOST_CHECK_MESSAGE (r.error.find ("got 3") != ustring::npos, r.error);
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(malformed_control_part)
  {
    setup ();

    {
      DecryptResult r = expect_rejected ("bad-control.eml", DecryptResult::MALFORMED_CONTROL_PART);
      BOOST_CHECK_MESSAGE (r.error.find ("text/plain") != ustring::npos, r.error);
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(unsupported_version)
  {
    setup ();

    {
      DecryptResult r = expect_rejected ("version-2.eml", DecryptResult::UNSUPPORTED_VERSION);
      BOOST_CHECK_MESSAGE (r.error.find ("'2'") != ustring::npos, r.error);

      r = expect_rejected ("no-version.eml", DecryptResult::UNSUPPORTED_VERSION);
      BOOST_CHECK_MESSAGE (r.error.find ("''") != ustring::npos, r.error);
    }

    teardown ();
  }

  BOOST_AUTO_TEST_CASE(malformed_content_part)
  {
    setup ();

    {
      DecryptResult r = expect_rejected ("bad-content.eml", DecryptResult::MALFORMED_CONTENT_PART);
      BOOST_CHECK_MESSAGE (r.error.find ("text/plain") != ustring::npos, r.error);
    }

    teardown ();
  }

BOOST_AUTO_TEST_SUITE_END()

