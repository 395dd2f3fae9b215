#pragma once

#include <chrono>
#include <string>
#include <cstdint>
#include <optional>

namespace vidfetch
{
  // Snapshot of one transfer's progress, for rendering.
  //
  struct progress_snapshot
  {
    std::uint64_t current_bytes {0};
    std::optional<std::uint64_t> total_bytes;
    float speed {0.0f}; // Bytes per second.
    int elapsed_seconds {0};

    // Without a total there is nothing to be a fraction of.
    //
    bool
    indeterminate () const noexcept
    {
      return !total_bytes || *total_bytes == 0;
    }

    // Progress ratio (0.0 - 1.0), 0 if indeterminate.
    //
    float
    progress_ratio () const noexcept
    {
      if (indeterminate ())
        return 0.0f;

      if (current_bytes >= *total_bytes)
        return 1.0f;

      return static_cast<float> (current_bytes) /
             static_cast<float> (*total_bytes);
    }

    // ETA in seconds, 0 if unknown.
    //
    int
    eta_seconds () const noexcept
    {
      if (indeterminate () || speed <= 0.0f || current_bytes >= *total_bytes)
        return 0;

      return static_cast<int> ((*total_bytes - current_bytes) / speed);
    }
  };

  // Traits for progress tracking customization.
  //
  template <typename S = std::string>
  struct progress_tracker_traits
  {
    using string_type = S;

    // EWMA alpha factor for speed calculation (0.0-1.0). Higher means more
    // weight on recent samples.
    //
    static constexpr float ewma_alpha = 0.2f;

    // Minimum interval between snapshots. The final update of a transfer
    // with a known total always goes through.
    //
    static constexpr int min_update_interval_ms = 100;

    // Format bytes and bytes per second in IEC units.
    //
    static string_type
    format_bytes (std::uint64_t bytes)
    {
      return format_scaled (static_cast<double> (bytes), "");
    }

    static string_type
    format_speed (float bytes_per_sec)
    {
      return format_scaled (bytes_per_sec, "/s");
    }

    static string_type
    format_scaled (double, const char* suffix);

    // Format duration as [<h>h]<mm>m<ss>s.
    //
    static string_type
    format_duration (int seconds);

    // Format progress bar of the given inner width.
    //
    static string_type
    format_bar (float progress, bool indeterminate, int width);
  };

  // Speed tracker fed from the transfer's progress callback.
  //
  // The transfer reports absolute byte counts and its start time. We turn
  // that into a throttled stream of snapshots with a smoothed speed.
  //
  template <typename T = progress_tracker_traits<>>
  class basic_progress_tracker
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using clock_type  = std::chrono::steady_clock;
    using time_point  = clock_type::time_point;

    basic_progress_tracker () = default;

    // Record the byte count at the given time. Return true if the snapshot
    // was updated (that is, it is worth re-rendering).
    //
    bool
    update (std::uint64_t bytes,
            std::optional<std::uint64_t> total,
            time_point start,
            time_point now) noexcept;

    const progress_snapshot&
    snapshot () const noexcept
    {
      return snapshot_;
    }

    void
    reset () noexcept;

  private:
    progress_snapshot snapshot_;

    std::uint64_t last_bytes_ {0};
    std::optional<time_point> last_time_;
  };

  using progress_tracker = basic_progress_tracker<>;
}

#include <vidfetch/progress/progress-tracker.txx>
