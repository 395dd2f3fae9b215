#pragma once

#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <atomic>
#include <utility>
#include <functional>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace vidfetch
{
  // Plain HTTP server on a loopback port for the tests.
  //
  // Serves one request per connection from a thread of its own with the
  // handler deciding the response. Every request is recorded so that a test
  // can check what actually went over the wire.
  //
  class http_test_server
  {
  public:
    using request_type  = boost::beast::http::request<
      boost::beast::http::string_body>;
    using response_type = boost::beast::http::response<
      boost::beast::http::string_body>;
    using handler_type  = std::function<response_type (const request_type&)>;

    explicit
    http_test_server (handler_type h)
      : handler_ (std::move (h)),
        acceptor_ (ioc_,
                   boost::asio::ip::tcp::endpoint (
                     boost::asio::ip::address_v4::loopback (), 0))
    {
      thread_ = std::thread ([this] {serve ();});
    }

    http_test_server (const http_test_server&) = delete;
    http_test_server& operator= (const http_test_server&) = delete;

    ~http_test_server ()
    {
      stop_ = true;

      // Wake up the blocking accept().
      //
      boost::system::error_code ec;
      boost::asio::io_context ioc;
      boost::asio::ip::tcp::socket s (ioc);
      s.connect (acceptor_.local_endpoint (), ec);

      thread_.join ();
    }

    unsigned short
    port () const
    {
      return acceptor_.local_endpoint ().port ();
    }

    // http://127.0.0.1:<port><target>
    //
    std::string
    url (const std::string& target = "/") const
    {
      return "http://127.0.0.1:" + std::to_string (port ()) + target;
    }

    std::vector<request_type>
    requests () const
    {
      std::lock_guard<std::mutex> l (mutex_);
      return requests_;
    }

    // Convenience response builder. Note that the body size becomes the
    // Content-Length unless the response is chunked.
    //
    static response_type
    respond (unsigned int status,
             std::string body = std::string (),
             std::vector<std::pair<std::string, std::string>> fields = {})
    {
      response_type r (static_cast<boost::beast::http::status> (status), 11);
      r.body () = std::move (body);

      for (auto& f: fields)
        r.set (f.first, f.second);

      return r;
    }

  private:
    void
    serve ()
    {
      namespace http = boost::beast::http;

      for (;;)
      {
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket s (ioc_);
        acceptor_.accept (s, ec);

        if (stop_)
          break;

        if (ec)
          continue;

        boost::beast::flat_buffer b;
        request_type rq;
        http::read (s, b, rq, ec);

        if (ec)
          continue;

        {
          std::lock_guard<std::mutex> l (mutex_);
          requests_.push_back (rq);
        }

        response_type rs (handler_ (rq));

        if (!rs.chunked ())
          rs.prepare_payload ();

        // HEAD responses announce the body they would have had.
        //
        if (rq.method () == http::verb::head)
        {
          http::response<http::empty_body> h (rs.result (), rs.version ());

          for (const auto& f: rs)
            h.set (f.name_string (), f.value ());

          h.content_length (rs.body ().size ());
          http::write (s, h, ec);
        }
        else
          http::write (s, rs, ec);

        s.shutdown (boost::asio::ip::tcp::socket::shutdown_send, ec);
      }
    }

  private:
    handler_type handler_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    std::atomic<bool> stop_ {false};

    mutable std::mutex mutex_;
    std::vector<request_type> requests_;
  };
}
