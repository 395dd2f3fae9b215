#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility> // std::exchange (used by boost/asio/awaitable.hpp)

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <vidfetch/http/http-types.hxx>
#include <vidfetch/http/http-client.hxx>
#include <vidfetch/http/http-connection.hxx>

#include <vidfetch/stream/stream-source.hxx>

namespace vidfetch
{
  // Response body of a GET request, read incrementally.
  //
  // The asynchronous interface is the real implementation. The blocking
  // read() drives it on the session's I/O context so that the transfer
  // engine can treat it as a plain byte stream.
  //
  class http_stream: public byte_stream
  {
  public:
    explicit
    http_stream (http_session&);

    http_stream (const http_stream&) = delete;
    http_stream& operator= (const http_stream&) = delete;

    // Send the request and read the response header, following redirects
    // (relative Location values included). Throw if the final status is not
    // 2xx. Return the response header fields.
    //
    asio::awaitable<http_headers>
    open (std::string url);

    asio::awaitable<std::size_t>
    read_some (char* buffer, std::size_t n);

    std::size_t
    read (char* buffer, std::size_t n) override;

    // The URL that actually served the body (after redirects).
    //
    const std::string&
    url () const noexcept
    {
      return url_;
    }

  private:
    asio::awaitable<http_headers>
    open_impl (std::string url, std::uint8_t redirect_count);

  private:
    using parser_type =
      beast::http::response_parser<beast::http::buffer_body>;

    http_session& session_;
    http_connection connection_;
    std::optional<parser_type> parser_;
    std::string url_;
    bool done_ {false};
  };

  // Stream source over HTTP(S).
  //
  class http_source: public stream_source
  {
  public:
    explicit
    http_source (http_session& s)
      : session_ (s) {}

    opened_stream
    open (const std::string& locator) override;

  private:
    http_session& session_;
  };
}
