# include <iostream>
# include <memory>
# include <map>

# include <unistd.h>

/* program options */
# include <boost/program_options.hpp>
# include <boost/filesystem.hpp>

/* log */
# include <boost/log/core.hpp>
# include <boost/log/utility/setup/console.hpp>
# include <boost/log/utility/setup/common_attributes.hpp>
# include <boost/log/sources/severity_logger.hpp>
# include <boost/log/sources/record_ostream.hpp>
# include <boost/date_time/posix_time/posix_time_types.hpp>
# include <boost/log/expressions.hpp>
# include <boost/log/trivial.hpp>
# include <boost/log/support/date_time.hpp>
# include <boost/log/sinks/sync_frontend.hpp>
# include <boost/log/sinks/syslog_backend.hpp>
# include <boost/make_shared.hpp>

# include "pgpmime.hh"
# include "build_config.hh"
# include "config.hh"
# include "message.hh"
# include "crypto.hh"
# include "decryptor.hh"

/* gmime */
# include <gmime/gmime.h>

using namespace std;
using namespace boost::filesystem;

namespace logging   = boost::log;
namespace keywords  = boost::log::keywords;
namespace expr      = boost::log::expressions;

/* globally available instance of the application */
PgpMime::PgpMime * PgpMime::pgpmime = NULL;
const char* const PgpMime::PgpMime::version = PGPMIME_VERSION;

namespace PgpMime {
  static const char * const log_ident = "pgpmime-decrypt";

  static const std::map<std::string, logging::trivial::severity_level> sevmap = {
    { "trace",   logging::trivial::trace },
    { "debug",   logging::trivial::debug },
    { "info",    logging::trivial::info },
    { "warning", logging::trivial::warning },
    { "error",   logging::trivial::error },
    { "fatal",   logging::trivial::fatal },
  };

  // Initialization and creation {{{
  void PgpMime::init_console_log () {
    /* log to stderr, stdout carries the message */
    logging::formatter format =
                  expr::stream
                      << "["
                      << expr::format_date_time< boost::posix_time::ptime >("TimeStamp", "%H:%M:%S")
                      << "] [" << logging::trivial::severity
                      << "] " << expr::smessage
              ;

    logging::add_console_log (std::clog)->set_formatter (format);
  }

  void PgpMime::init_sys_log () {
    typedef logging::sinks::synchronous_sink< logging::sinks::syslog_backend > sink_t;

    // Create a backend
    boost::shared_ptr< logging::sinks::syslog_backend > backend(new logging::sinks::syslog_backend(
          keywords::facility = logging::sinks::syslog::user,
          keywords::use_impl = logging::sinks::syslog::native,
          keywords::ident    = log_ident
          ));

    // Map the trivial severity levels onto syslog levels
    logging::sinks::syslog::custom_severity_mapping< logging::trivial::severity_level > mapping ("Severity");
    mapping[logging::trivial::trace]   = logging::sinks::syslog::debug;
    mapping[logging::trivial::debug]   = logging::sinks::syslog::debug;
    mapping[logging::trivial::info]    = logging::sinks::syslog::info;
    mapping[logging::trivial::warning] = logging::sinks::syslog::warning;
    mapping[logging::trivial::error]   = logging::sinks::syslog::error;
    mapping[logging::trivial::fatal]   = logging::sinks::syslog::critical;
    backend->set_severity_mapper (mapping);

    // Wrap it into the frontend and register in the core.
    // The backend requires synchronization in the frontend.
    logging::core::get()->add_sink(boost::make_shared< sink_t >(backend));
  }

  bool PgpMime::set_log_level (std::string level) {
    auto s = sevmap.find (level);

    if (s == sevmap.end ()) {
      return false;
    }

    logging::core::get()->set_filter (logging::trivial::severity >= s->second);
    return true;
  }

  PgpMime::PgpMime () {
    setlocale (LC_ALL, "");
    Glib::init ();

    /* user agent */
    user_agent = ustring::compose ("pgpmime-decrypt/%1", PgpMime::version);

    /* gmime settings */
    g_mime_init ();

    /* quiet until the configuration has been read */
    set_log_level ("warning");

    /* options */
    desc.add_options ()
      ( "help,h", "print this help message")
      ( "version,v", "print version and exit")
      ( "config,c", po::value<std::string>(), "config file, default: $XDG_CONFIG_HOME/pgpmime/config")
      ( "new-config,n", "write a new default config, then exit")
      ( "in-place,i", po::value<std::string>(), "decrypt this file and replace it, otherwise stdin is decrypted to stdout")
      ( "keep-original,k", "keep the encrypted message as an attachment")
      ( "no-envelope", "do not write the mbox 'From ' line")
      ( "log-level", po::value<std::string>(), "log level: trace, debug, info, warning, error or fatal")
      ( "disable-log", "disable logging");
  }
  // }}}

  int PgpMime::run (int argc, char **argv, Crypto * crypto) { // {{{
    po::variables_map vm;

    try {
      po::store ( po::parse_command_line (argc, argv, desc), vm );
      po::notify (vm);
    } catch (po::error &ex) {
      cerr << "pgpmime-decrypt: " << ex.what() << endl;
      cerr << desc << endl;
      return EXIT_USAGE;
    }

    if (vm.count("help")) {
      cout << "usage: pgpmime-decrypt [options]" << endl << endl;
      cout << desc << endl;
      return EXIT_OK;
    }

    if (vm.count("version")) {
      cout << user_agent << endl;
      return EXIT_OK;
    }

    logging::add_common_attributes ();

    bool disable_log = vm.count ("disable-log");
    if (disable_log) {
      logging::core::get()->set_logging_enabled (false);
    }

    /* make new config {{{ */
    if (vm.count("new-config")) {
      try {
        Config ncnf (false, true);

        if (vm.count("config")) {
          ncnf.std_paths.config_file = path (vm["config"].as<std::string>());
        }

        boost::system::error_code ec;
        bool found = exists (ncnf.std_paths.config_file, ec);

        if (ec) {
          cerr << "I/O error: " << ncnf.std_paths.config_file.string () << ": " << ec.message () << endl;
          return EXIT_IO;
        }

        if (found) {
          cerr << "pgpmime-decrypt: the config file: " << ncnf.std_paths.config_file.string () << " already exists." << endl;
          return EXIT_USAGE;
        }

        ncnf.load_config (true);
        ncnf.write_back_config ();

        cout << "pgpmime-decrypt: wrote default config to: " << ncnf.std_paths.config_file.string () << endl;

      } catch (config_error &ex) {
        cerr << "I/O error: " << ex.what () << endl;
        return EXIT_IO;
      }

      return EXIT_OK;
    } // }}}

    /* load config */
    try {
      if (vm.count("config")) {
        m_config = new Config (vm["config"].as<std::string>().c_str());
      } else {
        m_config = new Config ();
      }
    } catch (config_error &ex) {
      cerr << "I/O error: config: " << ex.what () << endl;
      return EXIT_IO;
    }

    /* setting up loggers */
    if (!disable_log) {
      bool log_stderr = config ("pgpmime.log").get<bool> ("stderr");
      bool log_syslog = config ("pgpmime.log").get<bool> ("syslog");

      if (log_stderr) init_console_log ();
      if (log_syslog) init_sys_log ();

      /* boost log falls back on a default sink when there are none */
      if (!log_stderr && !log_syslog) {
        logging::core::get()->set_logging_enabled (false);
      }

      std::string level = config ("pgpmime.log").get<std::string> ("level");
      if (vm.count ("log-level")) {
        level = vm["log-level"].as<std::string>();
      }

      if (!set_log_level (level)) {
        LOG (warn) << "app: unknown log level: " << level << ", using: warning";
        set_log_level ("warning");
      }
    }

    LOG (info) << "app: " << user_agent;

    bool keep_original = vm.count ("keep-original") ||
                         config ("decrypt").get<bool> ("keep_original");

    bool envelope = !vm.count ("no-envelope") &&
                    config ("output").get<bool> ("envelope");

    ustring in_place;
    if (vm.count ("in-place")) {
      in_place = vm["in-place"].as<std::string>();
    }

    if (crypto != NULL) {
      return process (in_place, keep_original, envelope, *crypto);
    }

    GpgCrypto gpg (config ("crypto"));
    return process (in_place, keep_original, envelope, gpg);
  } // }}}

  int PgpMime::process (ustring in_place, bool keep_original, bool envelope, Crypto & crypto) {
    std::unique_ptr<Message> msg;

    try {
      if (in_place.empty ()) {
        LOG (debug) << "app: reading message from stdin.";
        GMimeStream * in = g_mime_stream_pipe_new (STDIN_FILENO);
        g_mime_stream_pipe_set_owner (GMIME_STREAM_PIPE (in), FALSE);

        try {
          msg.reset (new Message (in));
        } catch (message_error &) {
          g_object_unref (in);
          throw;
        }
        g_object_unref (in);

      } else {
        msg.reset (new Message (in_place));
      }
    } catch (message_error &ex) {
      cerr << "I/O error: " << ex.what () << endl;
      return EXIT_IO;
    }

    Decryptor decryptor (config ("decrypt").get<std::string> ("header"), user_agent);

    DecryptResult r = decryptor.decrypt (*msg, crypto, keep_original);

    if (!r.ok ()) {
      if (r.is_validation_error ()) {
        LOG (info) << "app: " << DecryptResult::status_string (r.status);
        cerr << "PGP/MIME error: " << r.error << endl;
        return EXIT_PGPMIME;
      } else {
        cerr << "decryption backend error: " << r.error << endl;
        return EXIT_BACKEND;
      }
    }

    try {
      if (in_place.empty ()) {
        GMimeStream * out = g_mime_stream_pipe_new (STDOUT_FILENO);
        g_mime_stream_pipe_set_owner (GMIME_STREAM_PIPE (out), FALSE);

        try {
          msg->write (out, envelope);
        } catch (message_error &) {
          g_object_unref (out);
          throw;
        }
        g_object_unref (out);

      } else {
        msg->write_atomic (in_place, envelope);
      }
    } catch (message_error &ex) {
      cerr << "I/O error: " << ex.what () << endl;
      return EXIT_IO;
    }

    LOG (info) << "app: decrypted message" << (keep_original ? ", kept original." : ".");

    return EXIT_OK;
  }

  const boost::property_tree::ptree& PgpMime::config (const std::string& id) const {
    return m_config->config.get_child(id);
  }

  void PgpMime::main_test () { // {{{
    init_console_log ();

    m_config = new Config (true);

    set_log_level (config ("pgpmime.log").get<std::string> ("level"));
  } // }}}

  bool PgpMime::in_test () {
    return m_config && m_config->test;
  }

  PgpMime::~PgpMime () {
    LOG (debug) << "app: goodbye!";

    if (m_config) delete m_config;

    g_mime_shutdown ();
  }
}

