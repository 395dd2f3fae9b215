#include <vidfetch/transfer/transfer-engine.hxx>

#include <iostream>
#include <exception>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace vidfetch
{
  static const steady_transfer_clock default_clock {};

  transfer_engine::
  transfer_engine (stream_source& s)
    : transfer_engine (s, default_clock, cerr)
  {
  }

  transfer_engine::
  transfer_engine (stream_source& s, ostream& d)
    : transfer_engine (s, default_clock, d)
  {
  }

  transfer_engine::
  transfer_engine (stream_source& s, const transfer_clock& c, ostream& d)
    : source_ (s), clock_ (c), diag_ (d)
  {
  }

  fs::path transfer_engine::
  resolve_path (const media_descriptor& d, const fs::path& dest)
  {
    fs::path p (dest.empty () ? fs::path (".") : dest.lexically_normal ());

    error_code ec;
    if (fs::is_directory (p, ec))
      p /= d.file_name ();

    return p;
  }

  string transfer_engine::
  object_key (const media_descriptor& d, const string& dir)
  {
    string r (dir);

    while (!r.empty () && r.back () == '/')
      r.pop_back ();

    if (r.empty ())
      return d.file_name ();

    r += '/';
    r += d.file_name ();
    return r;
  }

  fs::path transfer_engine::
  download_to_file (const media_descriptor& d,
                    const fs::path& dest,
                    const file_transfer_options& o)
  {
    if (o.chunk_size == 0)
      throw invalid_argument ("chunk size must be greater than zero");

    fs::path p (resolve_path (d, dest));

    // Note that we check before touching the network so that a repeated
    // download fails fast and leaves the existing file alone.
    //
    error_code ec;
    if (!o.force_overwrite && fs::exists (p, ec))
      throw destination_conflict (p.string ());

    if (ec)
      throw transfer_io_failure ("unable to stat " + p.string () + ": " +
                                 ec.message ());

    file_sink s (p);
    copy (d.locator (), s, o);

    if (o.on_finish)
      o.on_finish (s.identifier ());

    return p;
  }

  optional<object_location> transfer_engine::
  download_to_store (const media_descriptor& d,
                     object_store& store,
                     const string& bucket,
                     const store_credentials& cr,
                     const store_transfer_options& o)
  {
    if (o.chunk_size == 0)
      throw invalid_argument ("chunk size must be greater than zero");

    unique_ptr<store_session> ss;
    unique_ptr<store_bucket> b;

    try
    {
      ss = store.authenticate (cr);
      b = ss->locate_bucket (bucket);
    }
    catch (const transfer_error&)
    {
      throw;
    }
    catch (const exception& e)
    {
      throw transfer_io_failure ("unable to access bucket " + bucket + ": " +
                                 e.what ());
    }

    if (b == nullptr)
    {
      diag_ << "warning: bucket " << bucket << " does not exist, "
            << "not transferring " << d.file_name () << endl;
      return nullopt;
    }

    string key (object_key (d, o.remote_dir));

    object_sink s (*b, key, o.acl_policy);
    copy (d.locator (), s, o);

    if (o.on_finish)
      o.on_finish (key);

    return object_location {bucket, move (key)};
  }

  transfer_state transfer_engine::
  copy (const string& locator, transfer_sink& sink, const transfer_options& o)
  {
    transfer_state st;
    st.start_time = clock_.now ();
    st.chunk.resize (o.chunk_size);

    opened_stream in;

    try
    {
      in = source_.open (locator);
    }
    catch (const transfer_error&)
    {
      throw;
    }
    catch (const exception& e)
    {
      throw transfer_io_failure ("unable to open " + locator + ": " +
                                 e.what ());
    }

    if (in.stream == nullptr)
      throw transfer_io_failure ("unable to open " + locator);

    optional<uint64_t> total (in.metadata.content_length ());

    if (!total)
      diag_ << "warning: " << locator << " did not advertise its size, "
            << "progress total is unknown" << endl;

    // From here on the sink may hold partial output that we must remove on
    // every failure path, including failures in the progress callback.
    //
    try
    {
      try
      {
        sink.open ();
      }
      catch (const transfer_error&)
      {
        throw;
      }
      catch (const exception& e)
      {
        throw transfer_io_failure ("unable to open " + sink.identifier () +
                                   ": " + e.what ());
      }

      for (;;)
      {
        if (o.cancel != nullptr && o.cancel->cancelled ())
          throw transfer_aborted ();

        size_t n;

        try
        {
          n = in.stream->read (st.chunk.data (), st.chunk.size ());
        }
        catch (const exception& e)
        {
          throw transfer_io_failure ("unable to read " + locator + ": " +
                                     e.what ());
        }

        if (n == 0)
          break;

        st.bytes_received += n;

        try
        {
          sink.write (st.chunk.data (), n);
        }
        catch (const transfer_error&)
        {
          throw;
        }
        catch (const exception& e)
        {
          throw transfer_io_failure ("unable to write " + sink.identifier () +
                                     ": " + e.what ());
        }

        if (o.on_progress)
          o.on_progress (st.bytes_received, total, st.start_time);
      }

      try
      {
        sink.close ();
      }
      catch (const transfer_error&)
      {
        throw;
      }
      catch (const exception& e)
      {
        throw transfer_io_failure ("unable to finalize " + sink.identifier () +
                                   ": " + e.what ());
      }
    }
    catch (...)
    {
      discard (sink);
      throw;
    }

    return st;
  }

  void transfer_engine::
  discard (transfer_sink& s) noexcept
  {
    if (!s.discard ())
      diag_ << "warning: unable to remove partial output " << s.identifier ()
            << endl;
  }
}
