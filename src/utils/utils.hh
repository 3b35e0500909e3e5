# include "ustring_utils.hh"
# include "date_utils.hh"

# include <boost/filesystem.hpp>

# pragma once

namespace bfs = boost::filesystem;

namespace PgpMime {

  class Utils {
    public:
      /* expand ~ to HOME */
      static bfs::path expand (bfs::path);
  };
}

