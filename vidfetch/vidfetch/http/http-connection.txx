#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

namespace vidfetch
{
  template <typename B>
  asio::awaitable<void> http_connection::
  write (beast::http::request<B>& r)
  {
    if (tls_ != nullptr)
      co_await beast::http::async_write (*tls_, r, asio::use_awaitable);
    else
      co_await beast::http::async_write (*tcp_, r, asio::use_awaitable);
  }

  template <typename M>
  asio::awaitable<void> http_connection::
  read (M& m)
  {
    if (tls_ != nullptr)
      co_await beast::http::async_read (*tls_, buffer_, m, asio::use_awaitable);
    else
      co_await beast::http::async_read (*tcp_, buffer_, m, asio::use_awaitable);
  }

  template <typename P>
  asio::awaitable<void> http_connection::
  read_header (P& p)
  {
    if (tls_ != nullptr)
      co_await beast::http::async_read_header (
        *tls_, buffer_, p, asio::use_awaitable);
    else
      co_await beast::http::async_read_header (
        *tcp_, buffer_, p, asio::use_awaitable);
  }

  template <typename P>
  asio::awaitable<std::size_t> http_connection::
  read_some (P& p)
  {
    beast::error_code ec;
    std::size_t n (0);

    if (tls_ != nullptr)
      n = co_await beast::http::async_read_some (
        *tls_, buffer_, p, asio::redirect_error (asio::use_awaitable, ec));
    else
      n = co_await beast::http::async_read_some (
        *tcp_, buffer_, p, asio::redirect_error (asio::use_awaitable, ec));

    if (ec && ec != beast::http::error::need_buffer)
      throw beast::system_error (ec);

    co_return n;
  }
}
