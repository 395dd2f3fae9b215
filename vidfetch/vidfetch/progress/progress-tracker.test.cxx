#include <vidfetch/progress/progress-tracker.hxx>
#include <vidfetch/progress/progress-renderer.hxx>

#include <chrono>
#include <string>
#include <cassert>
#include <sstream>

using namespace std;
using namespace vidfetch;

using traits = progress_tracker_traits<>;

static void
test_format ()
{
  assert (traits::format_bytes (0) == "0 B");
  assert (traits::format_bytes (1023) == "1023 B");
  assert (traits::format_bytes (1536) == "1.5 KiB");
  assert (traits::format_bytes (1024 * 1024) == "1.0 MiB");
  assert (traits::format_bytes (3ull * 1024 * 1024 * 1024) == "3.0 GiB");

  assert (traits::format_speed (500.0f) == "500 B/s");
  assert (traits::format_speed (2048.0f) == "2.0 KiB/s");
  assert (traits::format_speed (5.5f * 1024 * 1024) == "5.5 MiB/s");

  // Nothing bigger than GiB.
  //
  assert (traits::format_bytes (2048ull * 1024 * 1024 * 1024) == "2048.0 GiB");

  assert (traits::format_duration (0) == "00m00s");
  assert (traits::format_duration (65) == "01m05s");
  assert (traits::format_duration (3725) == "1h02m05s");
  assert (traits::format_duration (-3) == "00m00s");
}

static void
test_bar ()
{
  assert (traits::format_bar (0.0f, false, 10) == "[          ]");
  assert (traits::format_bar (0.5f, false, 10) == "[====>     ]");
  assert (traits::format_bar (1.0f, false, 10) == "[=========>]");
  assert (traits::format_bar (2.0f, false, 4) == "[===>]");

  // Indeterminate bars have the same width as determinate ones.
  //
  assert (traits::format_bar (0.0f, true, 10) == "[ <==>     ]");
  assert (traits::format_bar (0.0f, true, 3) == "[ <=]");

  assert (traits::format_bar (-1.0f, false, 3) == "[   ]");
  assert (traits::format_bar (0.5f, false, 0) == "[]");
}

static void
test_snapshot ()
{
  progress_snapshot s;
  assert (s.indeterminate ());
  assert (s.progress_ratio () == 0.0f);
  assert (s.eta_seconds () == 0);

  s.total_bytes = 20000;
  s.current_bytes = 5000;
  s.speed = 1000.0f;
  assert (!s.indeterminate ());
  assert (s.progress_ratio () == 0.25f);
  assert (s.eta_seconds () == 15);

  s.current_bytes = 25000;
  assert (s.progress_ratio () == 1.0f);
  assert (s.eta_seconds () == 0);
}

// Updates closer together than the minimum interval are dropped, except
// for the last one.
//
static void
test_tracker ()
{
  using namespace std::chrono;

  progress_tracker t;
  progress_tracker::time_point t0 (seconds (100));

  assert (t.update (8192, 20000, t0, t0 + seconds (1)));
  assert (t.snapshot ().current_bytes == 8192);
  assert (t.snapshot ().speed == 8192.0f);
  assert (t.snapshot ().elapsed_seconds == 1);

  assert (!t.update (16384, 20000, t0, t0 + seconds (1) + milliseconds (10)));
  assert (t.snapshot ().current_bytes == 8192);

  assert (t.update (20000, 20000, t0, t0 + seconds (1) + milliseconds (20)));
  assert (t.snapshot ().current_bytes == 20000);
  assert (t.snapshot ().progress_ratio () == 1.0f);
  assert (t.snapshot ().speed > 8192.0f);

  t.reset ();
  assert (t.snapshot ().current_bytes == 0);
  assert (!t.snapshot ().total_bytes);

  // Unknown total.
  //
  assert (t.update (100, nullopt, t0, t0 + seconds (2)));
  assert (t.snapshot ().indeterminate ());
  assert (t.snapshot ().speed == 50.0f);
}

static void
test_renderer ()
{
  ostringstream o;

  {
    progress_renderer r (o, "clip.mp4", 100);

    // Nothing rendered, nothing to finish.
    //
    r.finish ();
    assert (o.str ().empty ());

    progress_snapshot s;
    s.current_bytes = 20000;
    s.total_bytes = 20000;

    r.render (s);
    r.finish ();
  }

  string out (o.str ());
  assert (out.find ("clip.mp4") != string::npos);
  assert (out.find ("100%") != string::npos);
  assert (out.back () == '\n');
}

int
main ()
{
  test_format ();
  test_bar ();
  test_snapshot ();
  test_tracker ();
  test_renderer ();
}
