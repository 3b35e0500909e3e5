# include <iostream>
# include <string>
# include <vector>
# include <cstring>
# include <cerrno>

# include <unistd.h>
# include <stdlib.h>

# include <gmime/gmime.h>
# include <boost/filesystem.hpp>

# include "pgpmime.hh"
# include "message.hh"

using namespace std;
namespace bfs = boost::filesystem;

namespace PgpMime {
  Message::Message (ustring _fname) {
    LOG (info) << "msg: loading message from file: " << _fname;
    load_message_from_file (_fname);
  }

  Message::Message (GMimeStream * s) {
    LOG (info) << "msg: loading message from GMimeStream.";
    has_file = false;

    g_object_ref (s);
    try {
      load_message (s);
    } catch (message_error &) {
      g_object_unref (s);
      throw;
    }
    g_object_unref (s);
  }

  std::unique_ptr<Message> Message::from_bytes (const std::string & s) {
    GMimeStream * stream = g_mime_stream_mem_new_with_buffer (s.data (), s.size ());

    std::unique_ptr<Message> m;
    try {
      m.reset (new Message (stream));
    } catch (message_error &) {
      g_object_unref (stream);
      throw;
    }

    g_object_unref (stream);
    return m;
  }

  Message::~Message () {
    LOG (debug) << "msg: deconstruct";
    if (message) g_object_unref (message);
  }

  void Message::load_message_from_file (ustring _fname) {
    fname = _fname;

    boost::system::error_code ec;
    bool found = bfs::exists (fname.c_str(), ec);

    if (ec) {
      string error_s = "failed to open file: " + fname + ": " + ec.message ();
      LOG (error) << "msg: " << error_s;
      throw message_error (error_s);
    }

    if (!found) {
      LOG (error) << "msg: failed to open file: " << fname << ", it does not exist!";

      string error_s = "failed to open file: " + fname + ": no such file";
      throw message_error (error_s);
    }

    GError * err = NULL;
    GMimeStream * stream = g_mime_stream_file_open (fname.c_str(), "r", &err);
    if (stream == NULL) {
      string error_s = "failed to open file: " + fname;
      if (err != NULL) {
        error_s += ": " + string (err->message);
        g_error_free (err);
      }
      LOG (error) << "msg: " << error_s;

      throw message_error (error_s);
    }

    has_file = true;

    try {
      load_message (stream);
    } catch (message_error &) {
      g_object_unref (stream);
      throw;
    }

    g_object_unref (stream);
  }

  void Message::load_message (GMimeStream * s) {
    /* the whole message is read into memory first so that a leading
     * envelope line can be split off before parsing */
    GMimeStream * mem = g_mime_stream_mem_new ();

    if (g_mime_stream_write_to_stream (s, mem) == -1) {
      g_object_unref (mem);
      LOG (error) << "msg: failed to read message.";
      throw message_error ("failed to read message");
    }

    GByteArray * ba = g_mime_stream_mem_get_byte_array (GMIME_STREAM_MEM (mem));
    const char * data = (const char *) ba->data;
    gsize len   = ba->len;
    gsize start = 0;

    if (len >= 5 && strncmp (data, "From ", 5) == 0) {
      const char * nl = (const char *) memchr (data, '\n', len);
      gsize eol = (nl != NULL) ? (gsize) (nl - data) : len;

      envelope = string (data, eol);
      if (!envelope.empty () && envelope[envelope.size () - 1] == '\r') {
        envelope.erase (envelope.size () - 1);
        envelope_eol = "\r\n";
      }

      start = (nl != NULL) ? eol + 1 : len;

      LOG (debug) << "msg: envelope: " << envelope;
    }

    GMimeStream * body = g_mime_stream_mem_new_with_buffer (data + start, len - start);
    g_object_unref (mem);

    GMimeParser  * parser   = g_mime_parser_new_with_stream (body);
    GMimeMessage * _message = g_mime_parser_construct_message (parser, g_mime_parser_options_get_default ());

    g_object_unref (parser);
    g_object_unref (body);

    if (_message == NULL) {
      LOG (error) << "msg: failed to parse message.";
      throw message_error ("failed to parse message");
    }

    message = _message;

    LOG (debug) << "msg: content-type: " << content_type ();
  }

  bool Message::has_envelope () const {
    return !envelope.empty ();
  }

  GMimeObject * Message::mime_part () {
    if (message == NULL) return NULL;
    return g_mime_message_get_mime_part (message);
  }

  ustring Message::content_type () {
    GMimeObject * mp = mime_part ();
    if (mp == NULL) return "";

    GMimeContentType * ct = g_mime_object_get_content_type (mp);
    if (ct == NULL) return "";

    char * mt = g_mime_content_type_get_mime_type (ct);
    ustring t (mt);
    g_free (mt);

    return t.lowercase ();
  }

  std::string Message::to_bytes (bool with_envelope) {
    GMimeStream * mem = g_mime_stream_mem_new ();

    try {
      write (mem, with_envelope);
    } catch (message_error &) {
      g_object_unref (mem);
      throw;
    }

    GByteArray * ba = g_mime_stream_mem_get_byte_array (GMIME_STREAM_MEM (mem));
    std::string out ((const char *) ba->data, ba->len);

    g_object_unref (mem);

    return out;
  }

  void Message::write (GMimeStream * stream, bool with_envelope) {
    g_object_ref (stream);

    if (with_envelope && has_envelope ()) {
      std::string line = envelope + envelope_eol;
      if (g_mime_stream_write (stream, line.c_str (), line.size ()) == -1) {
        g_object_unref (stream);
        throw message_error ("failed to write envelope line");
      }
    }

    if (g_mime_object_write_to_stream (GMIME_OBJECT(message), g_mime_format_options_get_default (), stream) == -1) {
      g_object_unref (stream);
      throw message_error ("failed to write message");
    }

    if (g_mime_stream_flush (stream) != 0) {
      g_object_unref (stream);
      throw message_error ("failed to flush message");
    }

    g_object_unref (stream);

    LOG (debug) << "msg: wrote to stream.";
  }

  void Message::write (ustring _fname, bool with_envelope) {
    GError * err = NULL;
    GMimeStream * stream = g_mime_stream_file_open (_fname.c_str (), "w", &err);

    if (stream == NULL) {
      string error_s = "failed to open file for writing: " + _fname;
      if (err != NULL) {
        error_s += ": " + string (err->message);
        g_error_free (err);
      }
      LOG (error) << "msg: " << error_s;
      throw message_error (error_s);
    }

    try {
      write (stream, with_envelope);
    } catch (message_error &) {
      g_object_unref (stream);
      throw;
    }

    g_object_unref (stream);

    LOG (debug) << "msg: wrote file: " << _fname;
  }

  void Message::write_atomic (ustring _fname, bool with_envelope) {
    bfs::path dest (_fname.c_str ());
    bfs::path dir = dest.parent_path ();
    if (dir.empty ()) dir = bfs::path (".");

    std::string tmpl = (dir / bfs::path ("." + dest.filename ().string () + ".pgpmime-XXXXXX")).string ();
    std::vector<char> tmpname (tmpl.begin (), tmpl.end ());
    tmpname.push_back ('\0');

    int fd = mkstemp (tmpname.data ());
    if (fd == -1) {
      string error_s = "could not create temporary file in: " + dir.string () + ": " + strerror (errno);
      LOG (error) << "msg: " << error_s;
      throw message_error (error_s);
    }

    bfs::path tmp (tmpname.data ());
    LOG (debug) << "msg: writing to temporary file: " << tmp.string ();

    boost::system::error_code ec;

    /* GMimeStreamFs owns fd, flushing it fsyncs */
    GMimeStream * stream = g_mime_stream_fs_new (fd);
    try {
      write (stream, with_envelope);
    } catch (message_error &) {
      g_object_unref (stream);
      bfs::remove (tmp, ec);
      throw;
    }
    g_object_unref (stream);

    /* keep mode of the file we replace */
    bfs::file_status st = bfs::status (dest, ec);
    if (!ec && bfs::exists (st)) {
      bfs::permissions (tmp, st.permissions (), ec);
      if (ec) {
        LOG (warn) << "msg: could not copy permissions to: " << tmp.string () << ": " << ec.message ();
      }
    }

    bfs::rename (tmp, dest, ec);
    if (ec) {
      string error_s = "could not rename " + tmp.string () + " to " + dest.string () + ": " + ec.message ();
      LOG (error) << "msg: " << error_s;

      boost::system::error_code rec;
      bfs::remove (tmp, rec);

      throw message_error (error_s);
    }

    fname    = _fname;
    has_file = true;

    LOG (info) << "msg: wrote file: " << _fname;
  }

  message_error::message_error (const char * w) : runtime_error (w)
  {
  }

  message_error::message_error (const std::string & w) : runtime_error (w)
  {
  }
}

