# pragma once

# include <string>
# include <memory>
# include <stdexcept>

# include <gmime/gmime.h>

# include "proto.hh"
# include "pgpmime.hh"

namespace PgpMime {
  /* a single email message, optionally preceded by an mbox
   * envelope ('From sender date') line. */
  class Message {
    public:
      Message (ustring _fname);
      Message (GMimeStream *);
      ~Message ();

      /* parse a message held in memory */
      static std::unique_ptr<Message> from_bytes (const std::string &);

      Message (const Message &) = delete;
      Message & operator= (const Message &) = delete;

      ustring fname;
      bool    has_file = false;

      /* envelope line without line ending, empty if none */
      std::string envelope;
      /* line ending of the envelope line as read */
      std::string envelope_eol = "\n";
      bool has_envelope () const;

      GMimeMessage * message = NULL;

      /* top level mime part, NULL for a message without body */
      GMimeObject * mime_part ();

      /* lower case type/subtype of the top level mime part */
      ustring content_type ();

      std::string to_bytes (bool with_envelope = true);

      void write (GMimeStream *, bool with_envelope = true);
      void write (ustring fname, bool with_envelope = true);

      /* write to a temporary file next to fname, then rename it over
       * fname. fname is untouched if anything fails. */
      void write_atomic (ustring fname, bool with_envelope = true);

    private:
      void load_message_from_file (ustring);
      void load_message (GMimeStream *);
  };

  /* exceptions */
  class message_error : public std::runtime_error {
    public:
      message_error (const char *);
      message_error (const std::string &);
  };
}

