# include "pgpmime.hh"
# include "utils.hh"

# include <string>
# include <stdexcept>

# include <glib.h>
# include <boost/filesystem.hpp>

namespace bfs = boost::filesystem;

namespace PgpMime {
  bfs::path Utils::expand (bfs::path in) {
    ustring s = in.c_str ();
    if (s.size () < 1) return in;

    const char * home = getenv ("HOME");
    if (home == NULL) {
      LOG (error) << "error: HOME variable not set.";
      throw std::invalid_argument ("error: HOME environment variable not set.");
    }

    if (s[0] == '~') {
      s = ustring(home) + s.substr (1, s.size () - 1);
      return bfs::path (s);
    } else {
      return in;
    }
  }
}

