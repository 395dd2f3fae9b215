#include <cstddef>
#include <sstream>
#include <iomanip>
#include <iterator>
#include <algorithm>

namespace vidfetch
{
  // progress_tracker_traits default implementations.
  //
  template <typename S>
  S progress_tracker_traits<S>::
  format_scaled (double n, const char* suffix)
  {
    static const char* const units[] = {"B", "KiB", "MiB", "GiB"};

    std::size_t u (0);
    for (; n >= 1024.0 && u + 1 != std::size (units); ++u)
      n /= 1024.0;

    // Whole bytes, "500 B/s" rather than "500.0 B/s".
    //
    std::ostringstream o;
    o << std::fixed << std::setprecision (u == 0 ? 0 : 1)
      << n << ' ' << units[u] << suffix;

    return string_type (o.str ());
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_duration (int s)
  {
    if (s < 0)
      s = 0;

    std::ostringstream o;

    if (s >= 3600)
      o << s / 3600 << 'h';

    o << std::setfill ('0')
      << std::setw (2) << s % 3600 / 60 << 'm'
      << std::setw (2) << s % 60 << 's';

    return string_type (o.str ());
  }

  template <typename S>
  S progress_tracker_traits<S>::
  format_bar (float p, bool ind, int w)
  {
    std::string b;

    // Indeterminate: a fixed marker padded to the bar width, so that the rest
    // of the line does not move when the total is unknown.
    //
    if (ind)
      b = " <==>";
    else
    {
      p = std::clamp (p, 0.0f, 1.0f);

      int filled (static_cast<int> (p * w));
      if (filled > 0)
        b.assign (filled - 1, '=').push_back ('>');
    }

    b.resize (static_cast<std::size_t> (std::max (w, 0)), ' ');
    return string_type ('[' + b + ']');
  }

  template <typename T>
  bool basic_progress_tracker<T>::
  update (std::uint64_t n,
          std::optional<std::uint64_t> total,
          time_point start,
          time_point now) noexcept
  {
    using namespace std::chrono;

    bool last (total && n >= *total);

    // Throttle updates.
    //
    // Recalculating speed and redrawing on every chunk (8 KiB by default)
    // is wasteful and makes the speed jitter.
    //
    if (last_time_ && !last &&
        now - *last_time_ < milliseconds (traits_type::min_update_interval_ms))
      return false;

    time_point t0 (last_time_ ? *last_time_ : start);
    std::uint64_t n0 (last_time_ ? last_bytes_ : 0);

    // Calculate instantaneous speed.
    //
    float dt (duration<float> (now - t0).count ());
    float inst (0.0f);

    if (dt > 0.0f)
      inst = static_cast<float> (n > n0 ? n - n0 : 0) / dt;

    // Update EWMA (Exponentially Weighted Moving Average).
    //
    float s0 (snapshot_.speed);

    snapshot_.speed = s0 == 0.0f
      ? inst
      : traits_type::ewma_alpha * inst + (1.0f - traits_type::ewma_alpha) * s0;

    snapshot_.current_bytes = n;
    snapshot_.total_bytes = total;
    snapshot_.elapsed_seconds =
      static_cast<int> (duration_cast<seconds> (now - start).count ());

    last_bytes_ = n;
    last_time_ = now;

    return true;
  }

  template <typename T>
  void basic_progress_tracker<T>::
  reset () noexcept
  {
    snapshot_ = progress_snapshot ();
    last_bytes_ = 0;
    last_time_.reset ();
  }
}
