#pragma once

#include <chrono>
#include <memory>
#include <cstddef>
#include <utility> // std::exchange (used by boost/asio/awaitable.hpp)

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <vidfetch/http/http-types.hxx>

namespace vidfetch
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // A single client connection, either plain TCP or TLS over TCP.
  //
  // Beast's tcp_stream and ssl_stream have different APIs for connecting and
  // shutting down, but read and write are generic over the stream type. So
  // we keep both behind one object and dispatch on the scheme, instead of
  // duplicating every request path for the two cases.
  //
  class http_connection
  {
  public:
    http_connection (asio::io_context&, ssl::context&);

    http_connection (const http_connection&) = delete;
    http_connection& operator= (const http_connection&) = delete;

    ~http_connection ();

    // Resolve and connect to the URL's authority and, for https, perform the
    // TLS handshake (with SNI). Zero timeout means no timeout.
    //
    asio::awaitable<void>
    connect (const url_parts&, std::chrono::milliseconds timeout);

    // Set the deadline for the operations that follow. Zero means never.
    //
    void
    expires_after (std::chrono::milliseconds);

    template <typename B>
    asio::awaitable<void>
    write (beast::http::request<B>&);

    // Read a complete message.
    //
    template <typename M>
    asio::awaitable<void>
    read (M&);

    template <typename P>
    asio::awaitable<void>
    read_header (P&);

    // Read some of the body into the parser's buffer. Note that the
    // need_buffer condition (the buffer is full) is not an error here and is
    // cleared before returning.
    //
    template <typename P>
    asio::awaitable<std::size_t>
    read_some (P&);

    // Close the underlying socket, ignoring errors. We do not attempt a TLS
    // shutdown: plenty of servers just drop the connection after the
    // response and waiting for their close_notify can block until timeout.
    //
    void
    close () noexcept;

    bool
    secure () const noexcept
    {
      return tls_ != nullptr;
    }

    bool
    connected () const noexcept
    {
      return tcp_ != nullptr || tls_ != nullptr;
    }

  private:
    beast::tcp_stream&
    lowest_layer ();

  private:
    asio::io_context& ioc_;
    ssl::context& ssl_;
    beast::flat_buffer buffer_;

    std::unique_ptr<beast::tcp_stream> tcp_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
  };
}

#include <vidfetch/http/http-connection.txx>
