# pragma once

# include <functional>
# include <stdexcept>

# include "pgpmime.hh"

# include <boost/filesystem.hpp>
# include <boost/property_tree/ptree.hpp>
# include <boost/property_tree/json_parser.hpp>

namespace bfs = boost::filesystem;
using boost::property_tree::ptree;

namespace PgpMime {
  struct StandardPaths {
    bfs::path home;
    bfs::path config_dir;
    bfs::path config_file;
  };

  class Config {
    public:
      Config (bool _test = false, bool no_load = false);
      Config (const char *, bool no_load = false);

      /* dir env vars from XDG with defaults:
       * XDG_CONFIG_HOME  : $HOME/.config/
       */

      bool test;

      StandardPaths std_paths;

      void load_config (bool initial = false);
      void load_dirs ();
      bool check_config (ptree);
      void write_back_config ();

      ptree config;

      const int CONFIG_VERSION = 1;

    private:
      ptree setup_default_config ();

      /* merge of property trees */

      // from http://stackoverflow.com/questions/8154107/how-do-i-merge-update-a-boostproperty-treeptree
      template<typename T>
        void traverse_recursive(
            const boost::property_tree::ptree &parent,
            const boost::property_tree::ptree::path_type &childPath,
            const boost::property_tree::ptree &child, T &method);

      void traverse(
          const boost::property_tree::ptree &parent,
          std::function<void(const ptree &,
            const ptree::path_type &,
            const ptree&)> method);

      void merge(const ptree &parent,
                 const ptree::path_type &childPath,
                 const ptree &child);


      void merge_ptree (const ptree &pt);
  };

  /* exceptions */
  class config_error : public std::runtime_error {
    public:
      config_error (const char *);
  };
}

