#pragma once

#include <string>
#include <ostream>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <vidfetch/progress/progress-tracker.hxx>

namespace vidfetch
{
  // Renderer traits for customization.
  //
  template <typename S = std::string>
  struct progress_renderer_traits
  {
    using string_type = S;

    // Default bar width for rendering.
    //
    static constexpr int default_bar_width = 15;

    // Line width to use if the terminal size is unknown (not a terminal).
    //
    static constexpr int fallback_width = 80;

    // Render the progress line.
    //
    static ftxui::Element
    render_item (const string_type& label,
                 const progress_snapshot& snapshot,
                 int bar_width = default_bar_width);
  };

  // Single-line progress display.
  //
  // Each render() redraws the same terminal line in place and finish()
  // moves past it. Nothing is written until the first render().
  //
  template <typename T = progress_renderer_traits<>>
  class basic_progress_renderer
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    // Zero width means the terminal width.
    //
    basic_progress_renderer (std::ostream&, string_type label, int width = 0);
    ~basic_progress_renderer ();

    basic_progress_renderer (const basic_progress_renderer&) = delete;
    basic_progress_renderer& operator= (const basic_progress_renderer&) = delete;

    void
    render (const progress_snapshot&);

    // Terminate the progress line if anything was rendered.
    //
    void
    finish ();

  private:
    std::ostream& os_;
    string_type label_;
    int width_;
    std::string reset_position_;
    bool rendered_ {false};
  };

  using progress_renderer = basic_progress_renderer<>;
}

#include <vidfetch/progress/progress-renderer.txx>
