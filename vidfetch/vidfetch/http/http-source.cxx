#include <vidfetch/http/http-source.hxx>

#include <limits>
#include <memory>
#include <utility>
#include <stdexcept>

#include <vidfetch/http/http-request.hxx>
#include <vidfetch/http/http-blocking.hxx>

using namespace std;

namespace vidfetch
{
  namespace http = beast::http;

  http_stream::
  http_stream (http_session& s)
    : session_ (s),
      connection_ (s.io_context (), s.ssl_context ())
  {
  }

  asio::awaitable<http_headers> http_stream::
  open (string url)
  {
    co_return co_await open_impl (move (url), 0);
  }

  asio::awaitable<http_headers> http_stream::
  open_impl (string url, uint8_t redirect_count)
  {
    const auto& tr (session_.traits ());

    if (redirect_count >= tr.max_redirects)
      throw runtime_error ("maximum redirects exceeded");

    http_request req (http_method::get, url);
    req.normalize (tr.user_agent);

    url_parts parts (parse_url (url));

    http::request<http::empty_body> br;
    br.method (http::verb::get);
    br.target (parts.target);
    br.version (11);

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    co_await connection_.connect (parts,
                                  chrono::milliseconds (tr.connect_timeout));

    connection_.expires_after (chrono::milliseconds (tr.request_timeout));
    co_await connection_.write (br);

    // The body is read into whatever buffer the caller hands to read_some(),
    // so there is nothing to limit here.
    //
    parser_.emplace ();
    parser_->body_limit (numeric_limits<uint64_t>::max ());

    co_await connection_.read_header (*parser_);

    unsigned int st (parser_->get ().result_int ());

    if (st >= 300 && st < 400 && tr.follow_redirects)
    {
      auto loc (parser_->get ()[http::field::location]);

      if (!loc.empty ())
      {
        string next (resolve_url (url, string (loc)));
        connection_.close ();
        parser_.reset ();

        co_return co_await open_impl (move (next), redirect_count + 1);
      }
    }

    if (st < 200 || st >= 300)
      throw runtime_error ("GET " + url + " failed with status " +
                           std::to_string (st));

    http_headers r;
    for (const auto& f: parser_->get ())
      r.add (string (f.name_string ()), string (f.value ()));

    url_ = move (url);
    done_ = parser_->is_done ();

    if (done_)
      connection_.close ();

    co_return r;
  }

  asio::awaitable<size_t> http_stream::
  read_some (char* buf, size_t n)
  {
    if (!parser_)
      throw logic_error ("read from unopened HTTP stream");

    if (done_ || n == 0)
      co_return 0;

    const auto& tr (session_.traits ());
    auto& body (parser_->get ().body ());

    for (;;)
    {
      body.data = buf;
      body.size = n;

      connection_.expires_after (chrono::milliseconds (tr.request_timeout));
      co_await connection_.read_some (*parser_);

      size_t r (n - body.size);

      if (parser_->is_done ())
      {
        done_ = true;
        connection_.close ();
      }

      // Reading some of the message does not necessarily mean reading some
      // of the body (chunk headers, for example), so keep going until we
      // either have bytes or there are no more.
      //
      if (r != 0 || done_)
        co_return r;
    }
  }

  size_t http_stream::
  read (char* buf, size_t n)
  {
    return run_blocking (session_.io_context (), read_some (buf, n));
  }

  opened_stream http_source::
  open (const string& locator)
  {
    auto s (make_unique<http_stream> (session_));

    opened_stream r;
    r.metadata.headers = run_blocking (session_.io_context (),
                                       s->open (locator));
    r.stream = move (s);

    return r;
  }
}
