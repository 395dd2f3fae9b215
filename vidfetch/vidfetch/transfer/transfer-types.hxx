#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <stdexcept>
#include <functional>

namespace vidfetch
{
  // Transfer failures.
  //
  // Bucket-not-found and a missing size hint are not in this hierarchy: the
  // first is reported as an empty result and the second only degrades
  // progress reporting.
  //
  class transfer_error: public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Resolved local destination already exists and overwriting was not
  // requested. Thrown before any network activity.
  //
  class destination_conflict: public transfer_error
  {
  public:
    explicit
    destination_conflict (std::string path)
      : transfer_error ("destination " + path + " already exists"),
        path_ (std::move (path)) {}

    const std::string&
    path () const noexcept {return path_;}

  private:
    std::string path_;
  };

  // Cancellation was observed between chunks. Partial output has been
  // deleted by the time this is thrown.
  //
  class transfer_aborted: public transfer_error
  {
  public:
    transfer_aborted ()
      : transfer_error ("transfer aborted") {}
  };

  // Any other failure to open, read, write or finalize.
  //
  class transfer_io_failure: public transfer_error
  {
  public:
    using transfer_error::transfer_error;
  };

  using transfer_time_point = std::chrono::steady_clock::time_point;

  // Called after each chunk with the running byte count, the advertised
  // total (if any), and the time the transfer started.
  //
  using progress_callback =
    std::function<void (std::uint64_t bytes,
                        std::optional<std::uint64_t> total,
                        transfer_time_point start)>;

  // Called once on successful completion with the destination identifier
  // (file path or object key).
  //
  using finish_callback = std::function<void (const std::string&)>;

  // Cancellation request shared between whoever wants to stop a transfer
  // (signal handler, UI) and the copy loop that polls it between chunks.
  //
  class cancellation_token
  {
  public:
    void
    cancel () noexcept
    {
      cancelled_.store (true, std::memory_order_relaxed);
    }

    bool
    cancelled () const noexcept
    {
      return cancelled_.load (std::memory_order_relaxed);
    }

  private:
    std::atomic<bool> cancelled_ {false};
  };

  // Time source for the transfer start time.
  //
  class transfer_clock
  {
  public:
    virtual
    ~transfer_clock () = default;

    virtual transfer_time_point
    now () const = 0;
  };

  class steady_transfer_clock: public transfer_clock
  {
  public:
    transfer_time_point
    now () const override
    {
      return std::chrono::steady_clock::now ();
    }
  };

  // State of one in-flight transfer. Lives on the stack of the transfer
  // call, never on the descriptor.
  //
  struct transfer_state
  {
    std::uint64_t bytes_received {0};
    std::vector<char> chunk;
    transfer_time_point start_time;
  };

  // Options common to both destinations.
  //
  struct transfer_options
  {
    static constexpr std::size_t default_chunk_size = 8192;

    std::size_t chunk_size {default_chunk_size};

    progress_callback on_progress;
    finish_callback on_finish;

    // Not owned. May be null.
    //
    const cancellation_token* cancel {nullptr};
  };

  struct file_transfer_options: transfer_options
  {
    bool force_overwrite {false};
  };

  struct store_transfer_options: transfer_options
  {
    // Key prefix ("directory"). Empty means the bucket root.
    //
    std::string remote_dir;

    std::string acl_policy {"public-read"};
  };

  // Where an object-store transfer put the bytes.
  //
  struct object_location
  {
    std::string bucket;
    std::string key;
  };

  inline bool
  operator== (const object_location& x, const object_location& y)
  {
    return x.bucket == y.bucket && x.key == y.key;
  }

  inline bool
  operator!= (const object_location& x, const object_location& y)
  {
    return !(x == y);
  }
}
