# pragma once

# include <gmime/gmime.h>
# include <boost/property_tree/ptree.hpp>

# include "pgpmime.hh"
# include "proto.hh"

using boost::property_tree::ptree;

namespace PgpMime {
  /* decrypts a single OpenPGP block */
  class Crypto {
    public:
      virtual ~Crypto () { }

      /* reads the ciphertext from the current position of ciphertext
       * and writes the plaintext to plaintext. on failure false is
       * returned and error is set to the backend message. */
      virtual bool decrypt (GMimeStream * ciphertext,
                            GMimeStream * plaintext,
                            ustring & error) = 0;
  };

  class GpgCrypto : public Crypto {
    public:
      GpgCrypto (const ptree & config);
      ~GpgCrypto ();

      GpgCrypto (const GpgCrypto &) = delete;
      GpgCrypto & operator= (const GpgCrypto &) = delete;

      bool ready = false;

      bool decrypt (GMimeStream * ciphertext,
                    GMimeStream * plaintext,
                    ustring & error) override;

      bool decrypted        = false;
      bool decrypt_tried    = false;
      ustring decrypt_error = "";

    private:
      bool create_gpg_context ();
      GMimeCryptoContext * gpgctx = NULL;

      bool    enabled = true;
      ustring gpghome;
  };
}

