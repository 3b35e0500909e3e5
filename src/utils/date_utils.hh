# pragma once

# include <time.h>

# include "proto.hh"

namespace PgpMime {
  class Date {
    public:
      /* ISO-8601 in local time with seconds and utc offset,
       * i.e. 2010-11-08T16:35:02+0100 */
      static const char * const iso8601_format;

      static ustring iso8601 (time_t t);
      static ustring iso8601_now ();
  };
}

