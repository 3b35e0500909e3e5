# pragma once

# include <glibmm.h>

namespace PgpMime {
  class UstringUtils {
    public:
      static void trim (Glib::ustring &);
      static void trim_left (Glib::ustring &);
      static void trim_right (Glib::ustring &);
  };
}

