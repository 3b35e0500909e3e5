# include <boost/log/core.hpp>
# include "pgpmime.hh"

namespace logging = boost::log;

int main (int argc, char **argv) {
  PgpMime::pgpmime = new PgpMime::PgpMime ();
  int r = PgpMime::pgpmime->run (argc, argv);
  logging::core::get()->remove_all_sinks ();

  delete PgpMime::pgpmime;
  PgpMime::pgpmime = NULL;

  return r;
}

