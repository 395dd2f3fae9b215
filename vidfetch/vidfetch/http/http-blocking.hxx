#pragma once

#include <optional>
#include <utility>
#include <stdexcept>
#include <exception>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

namespace vidfetch
{
  namespace asio = boost::asio;

  // Drive a coroutine to completion on the calling thread and return its
  // result (or rethrow its exception).
  //
  // We run the context one handler at a time rather than with run() because
  // other work may be parked on it (e.g., the driver's signal_set) and run()
  // would not return until that completes as well. Handlers for that other
  // work still get dispatched while we wait, which is how an interrupt
  // delivered in the middle of a read reaches its cancellation token.
  //
  template <typename R>
  R
  run_blocking (asio::io_context& ioc, asio::awaitable<R> op)
  {
    std::optional<R> r;
    std::exception_ptr ex;
    bool done (false);

    asio::co_spawn (ioc,
                    std::move (op),
                    [&r, &ex, &done] (std::exception_ptr e, R v)
                    {
                      if (e)
                        ex = e;
                      else
                        r = std::move (v);

                      done = true;
                    });

    if (ioc.stopped ())
      ioc.restart ();

    while (!done)
    {
      if (ioc.run_one () == 0)
        throw std::runtime_error ("I/O context stopped before completion");
    }

    if (ex)
      std::rethrow_exception (ex);

    return std::move (*r);
  }

  inline void
  run_blocking (asio::io_context& ioc, asio::awaitable<void> op)
  {
    std::exception_ptr ex;
    bool done (false);

    asio::co_spawn (ioc,
                    std::move (op),
                    [&ex, &done] (std::exception_ptr e)
                    {
                      ex = e;
                      done = true;
                    });

    if (ioc.stopped ())
      ioc.restart ();

    while (!done)
    {
      if (ioc.run_one () == 0)
        throw std::runtime_error ("I/O context stopped before completion");
    }

    if (ex)
      std::rethrow_exception (ex);
  }
}
