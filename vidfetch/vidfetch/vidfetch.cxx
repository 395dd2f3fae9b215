#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <filesystem>

#include <boost/asio.hpp>

#include <vidfetch/media/media-descriptor.hxx>
#include <vidfetch/http/http-client.hxx>
#include <vidfetch/http/http-source.hxx>
#include <vidfetch/store/s3-store.hxx>
#include <vidfetch/transfer/transfer.hxx>
#include <vidfetch/progress/progress-tracker.hxx>
#include <vidfetch/progress/progress-renderer.hxx>

#include <vidfetch/vidfetch-options.hxx>
#include <vidfetch/version.hxx>

using namespace std;

namespace vidfetch
{
  static string
  env (const char* n)
  {
    const char* v (getenv (n));
    return v != nullptr ? v : string ();
  }

  // Credentials come from the usual AWS environment variables. Options, if
  // specified, win.
  //
  static store_credentials
  resolve_credentials (const options& o)
  {
    store_credentials r;
    r.access_key    = env ("AWS_ACCESS_KEY_ID");
    r.secret_key    = env ("AWS_SECRET_ACCESS_KEY");
    r.session_token = env ("AWS_SESSION_TOKEN");
    r.endpoint      = env ("AWS_ENDPOINT_URL");

    r.region = env ("AWS_REGION");
    if (r.region.empty ())
      r.region = env ("AWS_DEFAULT_REGION");

    if (o.region_specified ())
      r.region = o.region ();

    if (o.endpoint_specified ())
      r.endpoint = o.endpoint ();

    return r;
  }

  // Build the descriptor from the options, filling in the name and the
  // extension from the last URL path segment if they are not given.
  //
  static media_descriptor
  make_descriptor (const options& o)
  {
    string seg (parse_url (o.url ()).target);

    size_t q (seg.find_first_of ("?#"));
    if (q != string::npos)
      seg.erase (q);

    seg.erase (0, seg.rfind ('/') + 1);

    fs::path p (seg);

    string name (o.name_specified () ? o.name () : p.stem ().string ());
    string ext (o.extension_specified () ? o.extension () : string ());

    if (ext.empty ())
    {
      ext = p.extension ().string ();

      if (!ext.empty ())
        ext.erase (0, 1); // Leading dot.
      else
        ext = "mp4";
    }

    if (name.empty ())
      name = "video";

    auto optional_of = [] (bool s, const string& v)
      -> media_descriptor::optional_string
    {
      return s ? media_descriptor::optional_string (v) : nullopt;
    };

    return media_descriptor (
      o.url (),
      move (name),
      move (ext),
      optional_of (o.resolution_specified (), o.resolution ()),
      optional_of (o.video_codec_specified (), o.video_codec ()),
      optional_of (o.profile_specified (), o.profile ()),
      optional_of (o.video_bitrate_specified (), o.video_bitrate ()),
      optional_of (o.audio_codec_specified (), o.audio_codec ()),
      optional_of (o.audio_bitrate_specified (), o.audio_bitrate ()));
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace vidfetch;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "vidfetch " << VIDFETCH_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: vidfetch --url <url> [options]" << "\n"
        << "options:"                              << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (!opt.url_specified () || opt.url ().empty ())
    {
      cerr << "error: --url is required" << "\n"
           << "  info: run 'vidfetch --help' for more information" << endl;
      return 1;
    }

    media_descriptor d (make_descriptor (opt));

    if (opt.verbose ())
      cout << d << endl;

    asio::io_context ioc;

    http_client_traits<> ht;
    ht.connect_timeout = opt.connect_timeout ();
    ht.request_timeout = opt.request_timeout ();
    ht.verify_ssl      = !opt.no_verify_ssl ();
    ht.ssl_cert_file   = opt.ca_file ();
    ht.user_agent      = string ("vidfetch/") + VIDFETCH_VERSION_STR;

    http_client client (ioc, ht);
    http_source source (client.session ());

    // Interrupts are delivered through the same I/O context that drives the
    // transfer's reads, so the handler runs between chunks at the latest.
    //
    cancellation_token cancel;
    asio::signal_set signals (ioc, SIGINT, SIGTERM);

    signals.async_wait ([&cancel] (const boost::system::error_code& ec, int)
                        {
                          if (!ec)
                            cancel.cancel ();
                        });

    transfer_engine engine (source, cerr);

    progress_tracker tracker;
    optional<progress_renderer> renderer;

    if (!opt.quiet ())
      renderer.emplace (cerr, d.file_name ());

    progress_callback on_progress;

    if (renderer)
    {
      on_progress = [&tracker, &renderer] (uint64_t n,
                                           optional<uint64_t> total,
                                           transfer_time_point start)
      {
        if (tracker.update (n, total, start, chrono::steady_clock::now ()))
          renderer->render (tracker.snapshot ());
      };
    }

    int r (0);

    if (opt.bucket_specified ())
    {
      s3_store store (client);

      store_transfer_options o;
      o.chunk_size  = opt.chunk_size ();
      o.on_progress = on_progress;
      o.cancel      = &cancel;
      o.remote_dir  = opt.remote_dir ();
      o.acl_policy  = opt.acl ();

      optional<object_location> l (
        engine.download_to_store (d,
                                  store,
                                  opt.bucket (),
                                  resolve_credentials (opt),
                                  o));
      renderer.reset ();

      // The engine has already explained why in a warning.
      //
      if (!l)
        r = 1;
      else
        cout << l->bucket << '/' << l->key << endl;
    }
    else
    {
      file_transfer_options o;
      o.chunk_size      = opt.chunk_size ();
      o.on_progress     = on_progress;
      o.cancel          = &cancel;
      o.force_overwrite = opt.force ();

      fs::path p (engine.download_to_file (d, opt.output (), o));
      renderer.reset ();

      cout << p.string () << endl;
    }

    signals.cancel ();
    return r;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const destination_conflict& ex)
  {
    cerr << "error: " << ex.what () << "\n"
         << "  info: use --force to overwrite it" << endl;
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
