#include <sstream>
#include <iomanip>
#include <utility>

#include <ftxui/screen/terminal.hpp>

namespace vidfetch
{
  template <typename S>
  ftxui::Element progress_renderer_traits<S>::
  render_item (const string_type& label,
               const progress_snapshot& s,
               int w)
  {
    using namespace ftxui;
    using traits = progress_tracker_traits<S>;

    bool i (s.indeterminate ());
    float p (s.progress_ratio ());

    // We use fixed widths to prevent the layout from jittering as numbers
    // change.
    //
    std::ostringstream r;

    if (i)
      r << std::right << std::setw (5) << "";
    else
      r << std::right << std::setw (4) << static_cast<int> (p * 100) << "%";

    r << " " << traits::format_bar (p, i, w)
      << " | " << std::setw (12) << traits::format_speed (s.speed)
      << " | " << std::setw (10) << traits::format_bytes (s.current_bytes);

    // With a total we show the ETA, otherwise how long we have been at it.
    //
    if (i)
      r << " | " << std::setw (7)
        << traits::format_duration (s.elapsed_seconds);
    else
      r << " / " << std::setw (10) << traits::format_bytes (*s.total_bytes)
        << " | " << std::setw (7)
        << traits::format_duration (s.eta_seconds ());

    return hbox ({
      text (label),
      filler (),
      text (r.str ())
    });
  }

  template <typename T>
  basic_progress_renderer<T>::
  basic_progress_renderer (std::ostream& os, string_type l, int w)
    : os_ (os), label_ (std::move (l)), width_ (w)
  {
    if (width_ <= 0)
    {
      width_ = ftxui::Terminal::Size ().dimx;

      if (width_ <= 0)
        width_ = traits_type::fallback_width;
    }
  }

  template <typename T>
  basic_progress_renderer<T>::
  ~basic_progress_renderer ()
  {
    finish ();
  }

  template <typename T>
  void basic_progress_renderer<T>::
  render (const progress_snapshot& s)
  {
    using namespace ftxui;

    Element e (traits_type::render_item (label_, s));

    auto screen (Screen::Create (Dimension::Fixed (width_),
                                 Dimension::Fixed (1)));
    Render (screen, e);

    os_ << reset_position_ << screen.ToString () << std::flush;

    reset_position_ = screen.ResetPosition ();
    rendered_ = true;
  }

  template <typename T>
  void basic_progress_renderer<T>::
  finish ()
  {
    if (!rendered_)
      return;

    os_ << std::endl;

    reset_position_.clear ();
    rendered_ = false;
  }
}
