#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <filesystem>
#include <utility> // std::exchange (used by boost/asio/awaitable.hpp)

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <vidfetch/http/http-types.hxx>
#include <vidfetch/http/http-request.hxx>
#include <vidfetch/http/http-response.hxx>
#include <vidfetch/http/http-connection.hxx>

namespace vidfetch
{
  namespace fs = std::filesystem;

  // HTTP client configuration traits.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds (0 = no timeout).
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds (0 = no timeout). For streamed bodies
    // this applies to each read, not to the whole transfer.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects a media stream follows (see http_stream).
    //
    std::uint8_t max_redirects = 10;

    bool follow_redirects = true;

    // Whether to verify TLS certificates. Object store requests carry
    // credentials so this is on unless explicitly turned off.
    //
    bool verify_ssl = true;

    // CA bundle path (empty = use system defaults).
    //
    string_type ssl_cert_file;

    string_type user_agent = string_type ("vidfetch");
  };

  // HTTP client session: the I/O context, configuration and TLS context
  // shared by all the connections we open.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tls_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP client.
  //
  // Request/response exchanges with bodies held in memory, plus uploading a
  // request body straight from a file. Each exchange uses a fresh
  // connection. Used for the object store requests.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform a single exchange and return the response as is, redirects
    // included. Signed requests rely on this: the signature covers the host
    // and must not be forwarded anywhere else.
    //
    asio::awaitable<response_type>
    request (request_type);

    // Send a request with the body read from the file. The Content-Length
    // is the file size. Redirects are not followed either.
    //
    asio::awaitable<response_type>
    upload (request_type, const fs::path& body);

    session_type&
    session () noexcept
    {
      return *session_;
    }

    const session_type&
    session () const noexcept
    {
      return *session_;
    }

  private:
    // Send a prepared Beast request and read the whole response.
    //
    template <typename B>
    asio::awaitable<response_type>
    exchange (const url_parts&, beast::http::request<B>&);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <vidfetch/http/http-client.txx>
