# include <glib.h>
# include <gmime/gmime.h>

# include <string>

# include "pgpmime.hh"
# include "crypto.hh"
# include "utils/utils.hh"

namespace PgpMime {
  GpgCrypto::GpgCrypto (const ptree & config) {
    enabled = config.get<bool> ("gpg.enabled", true);
    gpghome = ustring (config.get<std::string> ("gpg.home", ""));

    if (!enabled) {
      LOG (warn) << "crypto: gpg is disabled.";
      ready = false;
      return;
    }

    ready = create_gpg_context ();
  }

  GpgCrypto::~GpgCrypto () {
    LOG (debug) << "crypto: deconstruct.";

    if (gpgctx) g_object_unref (gpgctx);
  }

  bool GpgCrypto::decrypt (GMimeStream * ciphertext, GMimeStream * plaintext, ustring & error) {
    LOG (debug) << "crypto: decrypting..";
    decrypt_tried = true;
    decrypted     = false;

    if (!enabled) {
      decrypt_error = "gpg is disabled in configuration";
      error = decrypt_error;
      return false;
    }

    if (!ready) {
      decrypt_error = "no gpg context available";
      error = decrypt_error;
      return false;
    }

    GError * err = NULL;
    GMimeDecryptResult * decrypt_res = g_mime_crypto_context_decrypt (
        gpgctx, GMIME_DECRYPT_NONE, NULL, ciphertext, plaintext, &err);

    if (decrypt_res == NULL) {
      decrypt_error = (err != NULL) ? ustring (err->message) : ustring ("unknown error");
      if (err != NULL) g_error_free (err);

      LOG (error) << "crypto: failed to decrypt message: " << decrypt_error;

      error = decrypt_error;
      return false;
    }

    /* only the key ids of the recipients are known, they may be
     * spoofed or zero (gpg -R) */
    GMimeCertificateList * rlist = g_mime_decrypt_result_get_recipients (decrypt_res);

    if (rlist != NULL) {
      for (int i = 0; i < g_mime_certificate_list_length (rlist); i++) {

        GMimeCertificate * ce = g_mime_certificate_list_get_certificate (rlist, i);

        const char * c = NULL;
        ustring fp = (c = g_mime_certificate_get_fingerprint (ce), c ? c : "");
        ustring nm = (c = g_mime_certificate_get_name (ce), c ? c : "");
        ustring em = (c = g_mime_certificate_get_email (ce), c ? c : "");
        ustring key = (c = g_mime_certificate_get_key_id (ce), c ? c : "");

        LOG (debug) << "crypto: encrypted for: " << nm << "(" << em << ") [" << fp << "] [" << key << "]";
      }
    }

    g_object_unref (decrypt_res);

    g_mime_stream_flush (plaintext);
    g_mime_stream_reset (plaintext);

    if (err != NULL) g_error_free (err);

    LOG (info) << "crypto: successfully decrypted message.";
    decrypted = true;

    return true;
  }

  bool GpgCrypto::create_gpg_context () {
    if (!gpghome.empty ()) {
      std::string home = Utils::expand (bfs::path (gpghome.c_str ())).string ();
      LOG (debug) << "crypto: GNUPGHOME: " << home;
      Glib::setenv ("GNUPGHOME", home, true);
    }

    gpgctx = g_mime_gpg_context_new ();

    if (! gpgctx) {
      LOG (error) << "crypto: failed to create gpg context.";
      return false;
    }

    LOG (debug) << "crypto: created gpg context.";

    return true;
  }
}

