# include <glibmm/datetime.h>
# include <time.h>

# include "pgpmime.hh"
# include "date_utils.hh"

namespace PgpMime {
  const char * const Date::iso8601_format = "%Y-%m-%dT%H:%M:%S%z";

  ustring Date::iso8601 (time_t t) {
    Glib::DateTime dt = Glib::DateTime::create_now_local (t);

    return dt.format (iso8601_format);
  }

  ustring Date::iso8601_now () {
    Glib::DateTime dt = Glib::DateTime::create_now_local ();

    return dt.format (iso8601_format);
  }
}

