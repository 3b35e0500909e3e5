# include <iostream>
# include <stdlib.h>
# include <functional>

# include <boost/filesystem.hpp>
# include <boost/filesystem/operations.hpp>
# include <boost/property_tree/ptree.hpp>
# include <boost/property_tree/json_parser.hpp>

# include "config.hh"
# include "utils/utils.hh"

using namespace std;
using namespace boost::filesystem;
using boost::property_tree::ptree;

namespace PgpMime {
  Config::Config (bool _test, bool no_load) {
    if (_test) {
      LOG (info) << "cf: loading test config.";
    }

    test = _test;

    load_dirs ();

    std_paths.config_file = std_paths.config_dir / path("config");

    if (!no_load)
      load_config ();
  }

  Config::Config (const char * fname, bool no_load) {
    test = false;

    load_dirs ();
    std_paths.config_file = path(fname);
    LOG (info) << "cf: loading config: " << fname;
    if (!no_load)
      load_config (); // re-sets config_dir to parent of fname
  }

  void Config::load_dirs () {

    if (test) {
      /* using $PWD/tests/test_home */

      path cur_path (current_path() );

      std_paths.home = cur_path / path("tests/test_home");

      LOG (debug) << "cf: using home and config_dir directory: " << std_paths.home.c_str ();

    } else {
      char * home_c = getenv ("HOME");

      if (home_c == NULL) {
        LOG (error) << "cf: HOME environment variable not set.";
        throw config_error ("HOME environment variable not set");
      }

      LOG (debug) << "HOME: " << home_c;
      std_paths.home = path(home_c);
    }

    /* default config */
    if (test) {
      std_paths.config_dir = std_paths.home;
    } else {
      char * config_home = getenv ("XDG_CONFIG_HOME");
      if (config_home == NULL) {
        std_paths.config_dir = std_paths.home / path(".config/pgpmime");
      } else {
        std_paths.config_dir = path(config_home) / path("pgpmime");
      }
    }
  }

  ptree Config::setup_default_config () {
    ptree default_config;
    default_config.put ("pgpmime.config.version", CONFIG_VERSION);

    default_config.put ("pgpmime.log.level", "warning"); // (trace, debug, info, warning, error, fatal)
    default_config.put ("pgpmime.log.stderr", true);
    default_config.put ("pgpmime.log.syslog", false);

    /* decryption */
    default_config.put ("decrypt.keep_original", false); // attach the encrypted original as message/rfc822
    default_config.put ("decrypt.header", "X-Pgpmime-Decrypted");

    /* output: write the mbox 'From ' line if the input had one */
    default_config.put ("output.envelope", true);

    /* crypto */
    default_config.put ("crypto.gpg.enabled", true);
    default_config.put ("crypto.gpg.home", ""); // GNUPGHOME, empty: gpg default

    return default_config;
  }

  void Config::write_back_config () {
    LOG (warn) << "cf: writing back config to: " << std_paths.config_file;

    try {
      if (!is_directory (std_paths.config_file.parent_path ())) {
        create_directories (std_paths.config_file.parent_path ());
      }

      write_json (std_paths.config_file.string (), config);

    } catch (const boost::property_tree::json_parser_error &ex) {
      throw config_error (ex.what ());
    } catch (const filesystem_error &ex) {
      throw config_error (ex.what ());
    }
  }

  void Config::load_config (bool initial) {
    if (test) {
      LOG (info) << "cf: test config, loading defaults.";
      config = setup_default_config ();
      config.put ("pgpmime.log.level", "debug");
      return;
    }

    LOG (info) << "cf: loading: " << std_paths.config_file;

    boost::system::error_code ec;

    path cwd = current_path (ec);
    if (ec) {
      LOG (error) << "cf: could not get current directory: " << ec.message ();
      throw config_error (ec.message ().c_str ());
    }

    std_paths.config_dir = absolute(std_paths.config_file.parent_path(), cwd);

    bool regular = is_regular_file (std_paths.config_file, ec);
    if (ec) {
      std::string error_s = std_paths.config_file.string () + ": " + ec.message ();
      LOG (error) << "cf: failed to read config: " << error_s;
      throw config_error (error_s.c_str ());
    }

    if (!regular) {
      if (!initial) {
        LOG (info) << "cf: no config, using defaults.";
      }
      config = setup_default_config ();
    } else {

      /* loading config file */
      ptree new_config;
      config = setup_default_config ();

      try {
        read_json (std_paths.config_file.string (), new_config);
      } catch (const boost::property_tree::json_parser_error &ex) {
        LOG (error) << "cf: failed to read config: " << ex.what ();
        throw config_error (ex.what ());
      }

      merge_ptree (new_config);
      LOG (info) << "cf: version: " << config.get<int>("pgpmime.config.version");

      check_config (new_config);
    }
  }


  bool Config::check_config (ptree new_config) {
    LOG (debug) << "cf: check config..";
    bool changed = false;

    if (new_config != config) {
      changed = true;
    }

    int version = config.get<int>("pgpmime.config.version");

    if (version < CONFIG_VERSION) {
      LOG (error) << "cf: the config file is an old version (" << version << "), the current version is: " << CONFIG_VERSION;
    }

    if (changed) {
      LOG (debug) << "cf: missing values in config have been filled with defaults (version: " << version << ", current: " << CONFIG_VERSION << ")";
    }

    return !changed;
  }

  /* merge of property trees */

  // from http://stackoverflow.com/questions/8154107/how-do-i-merge-update-a-boostproperty-treeptree
  template<typename T>
    void Config::traverse_recursive(
        const boost::property_tree::ptree &parent,
        const boost::property_tree::ptree::path_type &childPath,
        const boost::property_tree::ptree &child, T &method)
    {
      using boost::property_tree::ptree;

      method(parent, childPath, child);
      for(ptree::const_iterator it=child.begin();
          it!=child.end();
          ++it) {
        ptree::path_type curPath = childPath / ptree::path_type(it->first);
        traverse_recursive(parent, curPath, it->second, method);
      }
    }

  void Config::traverse(const ptree &parent,
            function<void(const ptree &,
            const ptree::path_type &,
            const ptree&)> method)
    {
      traverse_recursive(parent, "", parent, method);
    }

  void Config::merge(const ptree & /* parent */,
             const ptree::path_type &childPath,
             const ptree &child) {

    // overwrites existing default values
    config.put(childPath, child.data());
  }

  void Config::merge_ptree(const ptree &pt)   {
    using namespace std::placeholders;

    function<void(const ptree &,
      const ptree::path_type &,
      const ptree&)> method = bind (&Config::merge, this, _1, _2, _3);

    traverse(pt, method);
  }

  config_error::config_error (const char * w) : runtime_error (w)
  {
  }
}

