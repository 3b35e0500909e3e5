# pragma once

# include <glibmm.h>

/* forward declarations of classes and structs 'n stuff */
namespace PgpMime {

  /* aliases for often used types  */
  typedef Glib::ustring ustring;

  /* core */
  class PgpMime;
  class Config;
  struct StandardPaths;

  /* message */
  class Message;

  /* crypto */
  class Crypto;
  class GpgCrypto;

  /* decryption */
  class Decryptor;
  struct DecryptResult;

}

