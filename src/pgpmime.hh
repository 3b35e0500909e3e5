# pragma once

# include <string>

# include <boost/property_tree/ptree.hpp>
# include <boost/program_options.hpp>
# include <boost/log/trivial.hpp>

# define LOG(x) BOOST_LOG_TRIVIAL(x)
# define warn warning

# include "proto.hh"

namespace po = boost::program_options;

namespace PgpMime {
  class PgpMime {
    public:
      PgpMime ();
      ~PgpMime ();

      /* crypto: decryption backend, NULL for gpg from the config */
      int run (int, char**, Crypto * crypto = NULL);
      void main_test ();

      const boost::property_tree::ptree& config (const std::string& path=std::string()) const;
      bool  in_test ();

      static const char* const version;
      ustring user_agent;

      /* process exit codes */
      enum ExitCode {
        EXIT_OK         = 0,
        EXIT_PGPMIME    = 1,  /* structural validation failed */
        EXIT_BACKEND    = 2,  /* decryption backend failed */
        EXIT_IO         = 3,
        EXIT_USAGE      = 64,
      };

    protected:
      Config * m_config = NULL;

    private:
      void init_console_log ();
      void init_sys_log ();
      bool set_log_level (std::string);

      int  process (ustring in_place, bool keep_original, bool envelope, Crypto & crypto);

      po::options_description desc;
  };

  /* globally available instance of the application */
  extern PgpMime * pgpmime;
}

