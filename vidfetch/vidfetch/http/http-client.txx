#include <chrono>
#include <limits>

#include <openssl/ssl.h>

namespace vidfetch
{
  // Convert our method enum to the Beast verb.
  //
  inline beast::http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return beast::http::verb::get;
      case http_method::head:    return beast::http::verb::head;
      case http_method::put:     return beast::http::verb::put;
      case http_method::delete_: return beast::http::verb::delete_;
    }
    return beast::http::verb::get;
  }

  inline http_status
  from_beast_status (unsigned int s)
  {
    return static_cast<http_status> (static_cast<std::uint16_t> (s));
  }

  template <typename T>
  void basic_http_session<T>::
  configure_ssl ()
  {
    // Use the CA bundle if one is specified. Otherwise fall back to the
    // system default verify paths.
    //
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  // Note that there is no redirect handling here: a redirect response is
  // returned to the caller like any other.
  //
  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type req)
  {
    const auto& tr (session_->traits ());

    req.normalize (tr.user_agent);

    url_parts parts (parse_url (req.url));

    beast::http::request<beast::http::string_body> br;
    br.method (to_beast_verb (req.method));
    br.target (parts.target);
    br.version (req.version.major * 10 + req.version.minor);

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    if (req.body)
    {
      br.body () = *req.body;
      br.prepare_payload ();
    }
    else if (req.method == http_method::put)
      br.content_length (0);

    co_return co_await exchange (parts, br);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  upload (request_type req, const fs::path& file)
  {
    const auto& tr (session_->traits ());

    req.normalize (tr.user_agent);

    url_parts parts (parse_url (req.url));

    beast::http::request<beast::http::file_body> br;
    br.method (to_beast_verb (req.method));
    br.target (parts.target);
    br.version (req.version.major * 10 + req.version.minor);

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    beast::error_code ec;
    br.body ().open (file.string ().c_str (), beast::file_mode::scan, ec);

    if (ec)
      throw beast::system_error (ec, "unable to open " + file.string ());

    br.prepare_payload ();

    co_return co_await exchange (parts, br);
  }

  template <typename T>
  template <typename B>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (const url_parts& parts, beast::http::request<B>& br)
  {
    const auto& tr (session_->traits ());

    http_connection c (session_->io_context (), session_->ssl_context ());

    co_await c.connect (parts, std::chrono::milliseconds (tr.connect_timeout));

    c.expires_after (std::chrono::milliseconds (tr.request_timeout));
    co_await c.write (br);

    // A HEAD response announces a body it does not have, so tell the parser
    // not to wait for it.
    //
    beast::http::response_parser<beast::http::string_body> p;
    p.body_limit (std::numeric_limits<std::uint64_t>::max ());

    if (br.method () == beast::http::verb::head)
      p.skip (true);

    co_await c.read (p);
    c.close ();

    const auto& bres (p.get ());

    response_type r;
    r.status = from_beast_status (bres.result_int ());
    r.reason = string_type (bres.reason ());

    for (const auto& h: bres)
      r.headers.add (string_type (h.name_string ()),
                     string_type (h.value ()));

    if (!bres.body ().empty ())
      r.body = bres.body ();

    co_return r;
  }
}
