#include <vidfetch/http/http-connection.hxx>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

using namespace std;

namespace vidfetch
{
  using tcp = asio::ip::tcp;

  http_connection::
  http_connection (asio::io_context& ioc, ssl::context& ssl)
    : ioc_ (ioc), ssl_ (ssl)
  {
  }

  http_connection::
  ~http_connection ()
  {
    close ();
  }

  beast::tcp_stream& http_connection::
  lowest_layer ()
  {
    return tls_ != nullptr ? beast::get_lowest_layer (*tls_) : *tcp_;
  }

  void http_connection::
  expires_after (chrono::milliseconds t)
  {
    if (!connected ())
      return;

    if (t.count () == 0)
      lowest_layer ().expires_never ();
    else
      lowest_layer ().expires_after (t);
  }

  asio::awaitable<void> http_connection::
  connect (const url_parts& u, chrono::milliseconds t)
  {
    close ();
    buffer_.clear ();

    tcp::resolver rslv (ioc_);
    auto addrs (co_await rslv.async_resolve (
      u.host, u.port, asio::use_awaitable));

    if (u.secure ())
    {
      tls_ = make_unique<beast::ssl_stream<beast::tcp_stream>> (ioc_, ssl_);

      // Set the SNI hostname. Beast does not wrap this so we go through the
      // OpenSSL handle. Failing here means the handshake would most likely
      // fail or get the wrong certificate.
      //
      if (!SSL_set_tlsext_host_name (tls_->native_handle (), u.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }
    }
    else
      tcp_ = make_unique<beast::tcp_stream> (ioc_);

    expires_after (t);
    co_await lowest_layer ().async_connect (addrs, asio::use_awaitable);

    if (tls_ != nullptr)
      co_await tls_->async_handshake (ssl::stream_base::client,
                                      asio::use_awaitable);
  }

  void http_connection::
  close () noexcept
  {
    if (!connected ())
      return;

    beast::error_code ec;
    lowest_layer ().socket ().shutdown (tcp::socket::shutdown_both, ec);
    lowest_layer ().socket ().close (ec);

    tls_.reset ();
    tcp_.reset ();
  }
}
