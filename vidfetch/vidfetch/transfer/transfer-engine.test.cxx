#include <vidfetch/transfer/transfer-engine.hxx>

#include <map>
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cassert>
#include <fstream>
#include <sstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <filesystem>

using namespace std;
using namespace vidfetch;

namespace fs = std::filesystem;

// Source that serves a fixed string and records what is asked of it.
//
class fake_source: public stream_source
{
public:
  string data;
  bool advertise {true};

  // Throw on the read following this many successful reads.
  //
  optional<size_t> fail_after;

  size_t opens {0};
  string last_locator;
  vector<size_t> reads; // Sizes of non-empty reads.

  explicit
  fake_source (size_t n)
    : data (n, '\0')
  {
    for (size_t i (0); i != n; ++i)
      data[i] = static_cast<char> ('a' + i % 26);
  }

  opened_stream
  open (const string& locator) override
  {
    ++opens;
    last_locator = locator;

    opened_stream r;
    r.stream = make_unique<stream> (*this);

    if (advertise)
      r.metadata.headers.add ("content-length", std::to_string (data.size ()));

    return r;
  }

private:
  class stream: public byte_stream
  {
  public:
    explicit
    stream (fake_source& s): s_ (s) {}

    size_t
    read (char* b, size_t n) override
    {
      if (s_.fail_after && s_.reads.size () == *s_.fail_after)
        throw runtime_error ("connection reset");

      size_t r (min (n, s_.data.size () - pos_));
      s_.data.copy (b, r, pos_);
      pos_ += r;

      if (r != 0)
        s_.reads.push_back (r);

      return r;
    }

  private:
    fake_source& s_;
    size_t pos_ {0};
  };
};

// Object store that keeps everything in memory and logs every call.
//
struct store_log
{
  bool has_bucket {true};
  store_credentials credentials;
  vector<string> events;
  map<string, string> objects;
  size_t writers {0};

  // Make the corresponding writer call throw.
  //
  bool fail_close {false};
  bool fail_acl {false};
  bool fail_remove {false};
};

class fake_writer: public object_writer
{
public:
  fake_writer (store_log& l, string k): log_ (l), key_ (move (k)) {}

  void
  write (const char* d, size_t n) override
  {
    staged_.append (d, n);
  }

  void
  close () override
  {
    if (log_.fail_close)
      throw runtime_error ("PUT failed with status 500");

    log_.objects[key_] = staged_;
    log_.events.push_back ("close " + key_);
  }

  void
  set_access_policy (const string& p) override
  {
    if (log_.fail_acl)
      throw runtime_error ("PUT ACL failed with status 403");

    log_.events.push_back ("acl " + key_ + ' ' + p);
  }

  void
  remove () override
  {
    if (log_.fail_remove)
      throw runtime_error ("DELETE failed with status 500");

    log_.objects.erase (key_);
    log_.events.push_back ("remove " + key_);
  }

private:
  store_log& log_;
  string key_;
  string staged_;
};

class fake_bucket: public store_bucket
{
public:
  fake_bucket (store_log& l, string n): log_ (l), name_ (move (n)) {}

  const string&
  name () const override {return name_;}

  unique_ptr<object_writer>
  create_object (const string& k) override
  {
    ++log_.writers;
    log_.events.push_back ("create " + k);
    return make_unique<fake_writer> (log_, k);
  }

private:
  store_log& log_;
  string name_;
};

class fake_session: public store_session
{
public:
  explicit
  fake_session (store_log& l): log_ (l) {}

  unique_ptr<store_bucket>
  locate_bucket (const string& n) override
  {
    log_.events.push_back ("locate " + n);

    if (!log_.has_bucket)
      return nullptr;

    return make_unique<fake_bucket> (log_, n);
  }

private:
  store_log& log_;
};

class fake_store: public object_store
{
public:
  store_log log;

  unique_ptr<store_session>
  authenticate (const store_credentials& c) override
  {
    log.credentials = c;
    log.events.push_back ("auth");
    return make_unique<fake_session> (log);
  }
};

class fixed_clock: public transfer_clock
{
public:
  transfer_time_point
  now () const override
  {
    return transfer_time_point (chrono::seconds (42));
  }
};

static const fixed_clock test_clock {};

static fs::path
scratch (const string& name)
{
  fs::path d (fs::temp_directory_path () / ("vidfetch-transfer-" + name));
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static string
slurp (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  return string (istreambuf_iterator<char> (ifs), istreambuf_iterator<char> ());
}

static media_descriptor
clip ()
{
  return media_descriptor ("http://x/v", "clip", "mp4");
}

// The 20000-byte download in 8192-byte chunks into a directory.
//
static void
test_file_download ()
{
  fs::path d (scratch ("file"));

  fake_source src (20000);
  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  vector<uint64_t> progress;
  vector<string> finished;

  file_transfer_options o;
  o.on_progress = [&progress] (uint64_t n,
                               optional<uint64_t> t,
                               transfer_time_point s)
  {
    assert (t && *t == 20000);
    assert (s == transfer_time_point (chrono::seconds (42)));
    progress.push_back (n);
  };
  o.on_finish = [&finished] (const string& p) {finished.push_back (p);};

  fs::path r (e.download_to_file (clip (), d, o));

  assert (r == d / "clip.mp4");
  assert (src.opens == 1);
  assert (src.last_locator == "http://x/v");
  assert ((src.reads == vector<size_t> {8192, 8192, 3616}));

  assert (fs::file_size (r) == 20000);
  assert (slurp (r) == src.data);

  // Progress is non-decreasing and ends at the number of bytes written.
  //
  assert ((progress == vector<uint64_t> {8192, 16384, 20000}));

  assert (finished.size () == 1);
  assert (finished[0] == r.string ());

  assert (diag.str ().empty ());

  fs::remove_all (d);
}

// An existing destination is never touched without force_overwrite, no
// matter how many times we try.
//
static void
test_file_conflict ()
{
  fs::path d (scratch ("conflict"));
  fs::path p (d / "clip.mp4");

  {
    ofstream ofs (p, ios::binary);
    ofs << "keep";
  }

  fake_source src (20000);
  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  bool finished (false);
  file_transfer_options o;
  o.on_finish = [&finished] (const string&) {finished = true;};

  for (int i (0); i != 2; ++i)
  {
    bool thrown (false);

    try
    {
      e.download_to_file (clip (), d, o);
    }
    catch (const destination_conflict& x)
    {
      thrown = true;
      assert (x.path () == p.string ());
    }

    assert (thrown);
    assert (src.opens == 0);
    assert (src.reads.empty ());
    assert (!finished);
    assert (slurp (p) == "keep");
  }

  // Given as a file path rather than a directory, same thing.
  //
  {
    bool thrown (false);

    try
    {
      e.download_to_file (clip (), p);
    }
    catch (const transfer_error&)
    {
      thrown = true;
    }

    assert (thrown);
    assert (src.opens == 0);
  }

  // Forced, the file is replaced.
  //
  o.force_overwrite = true;
  fs::path r (e.download_to_file (clip (), d, o));

  assert (r == p);
  assert (finished);
  assert (fs::file_size (p) == 20000);

  fs::remove_all (d);
}

// A destination that is not a directory is used as the file path.
//
static void
test_file_path ()
{
  fs::path d (scratch ("path"));
  fs::path p (d / "renamed.bin");

  fake_source src (100);
  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  assert (e.download_to_file (clip (), p) == p);
  assert (fs::file_size (p) == 100);
  assert (!fs::exists (d / "clip.mp4"));

  assert (transfer_engine::resolve_path (clip (), d) == d / "clip.mp4");
  assert (transfer_engine::resolve_path (clip (), p) == p);

  fs::remove_all (d);
}

// Cancellation between chunks removes the partial file.
//
static void
test_file_abort ()
{
  fs::path d (scratch ("abort"));

  fake_source src (20000);
  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  cancellation_token tok;
  bool finished (false);

  file_transfer_options o;
  o.cancel = &tok;
  o.on_progress = [&tok] (uint64_t n, optional<uint64_t>, transfer_time_point)
  {
    if (n >= 8192)
      tok.cancel ();
  };
  o.on_finish = [&finished] (const string&) {finished = true;};

  bool thrown (false);

  try
  {
    e.download_to_file (clip (), d, o);
  }
  catch (const transfer_aborted&)
  {
    thrown = true;
  }

  assert (thrown);
  assert (src.reads.size () == 1);
  assert (!finished);
  assert (!fs::exists (d / "clip.mp4"));

  fs::remove_all (d);
}

// A failing read is an I/O failure and the partial file goes away as well.
//
static void
test_file_read_failure ()
{
  fs::path d (scratch ("failure"));

  fake_source src (20000);
  src.fail_after = 1;

  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  bool thrown (false);

  try
  {
    e.download_to_file (clip (), d);
  }
  catch (const transfer_aborted&)
  {
    assert (false);
  }
  catch (const transfer_io_failure& x)
  {
    thrown = true;
    assert (string (x.what ()).find ("connection reset") != string::npos);
  }

  assert (thrown);
  assert (!fs::exists (d / "clip.mp4"));

  fs::remove_all (d);
}

// Without a size hint we warn and report an unknown total.
//
static void
test_missing_size ()
{
  fs::path d (scratch ("size"));

  fake_source src (10000);
  src.advertise = false;

  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  uint64_t last (0);
  file_transfer_options o;
  o.on_progress = [&last] (uint64_t n,
                           optional<uint64_t> t,
                           transfer_time_point)
  {
    assert (!t);
    assert (n > last);
    last = n;
  };

  e.download_to_file (clip (), d, o);

  assert (last == 10000);
  assert (fs::file_size (d / "clip.mp4") == 10000);
  assert (diag.str ().find ("warning:") == 0);
  assert (diag.str ().find ("http://x/v") != string::npos);

  fs::remove_all (d);
}

static void
test_chunk_size ()
{
  fs::path d (scratch ("chunk"));

  fake_source src (10);
  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  file_transfer_options o;
  o.chunk_size = 0;

  bool thrown (false);

  try
  {
    e.download_to_file (clip (), d, o);
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }

  assert (thrown);
  assert (src.opens == 0);
  assert (!fs::exists (d / "clip.mp4"));

  // Odd chunk sizes are fine.
  //
  o.chunk_size = 3;
  e.download_to_file (clip (), d, o);
  assert (src.reads.size () == 4);
  assert (src.reads.back () == 1);

  fs::remove_all (d);
}

static void
test_object_key ()
{
  media_descriptor m (clip ());

  assert (transfer_engine::object_key (m, "") == "clip.mp4");
  assert (transfer_engine::object_key (m, "/") == "clip.mp4");
  assert (transfer_engine::object_key (m, "videos") == "videos/clip.mp4");
  assert (transfer_engine::object_key (m, "videos//") == "videos/clip.mp4");
  assert (transfer_engine::object_key (m, "a/b/") == "a/b/clip.mp4");
}

// Store transfer: the object is written, then the policy is applied, then
// the finish callback is called with the key.
//
static void
test_store_download ()
{
  fake_source src (20000);
  fake_store st;
  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  store_credentials cr;
  cr.access_key = "AKID";
  cr.secret_key = "secret";

  vector<string> finished;
  vector<uint64_t> progress;

  store_transfer_options o;
  o.remote_dir = "videos/";
  o.on_progress = [&progress] (uint64_t n,
                               optional<uint64_t>,
                               transfer_time_point)
  {
    progress.push_back (n);
  };
  o.on_finish = [&finished, &st] (const string& k)
  {
    // By now the policy must have been applied.
    //
    assert (st.log.events.back () == "acl " + k + " public-read");
    finished.push_back (k);
  };

  optional<object_location> r (
    e.download_to_store (clip (), st, "media", cr, o));

  assert (r);
  assert (r->bucket == "media");
  assert (r->key == "videos/clip.mp4");

  assert (st.log.credentials.access_key == "AKID");
  assert ((st.log.events == vector<string> {
            "auth",
            "locate media",
            "create videos/clip.mp4",
            "close videos/clip.mp4",
            "acl videos/clip.mp4 public-read"}));

  assert (st.log.objects.at ("videos/clip.mp4") == src.data);
  assert ((src.reads == vector<size_t> {8192, 8192, 3616}));
  assert ((progress == vector<uint64_t> {8192, 16384, 20000}));
  assert ((finished == vector<string> {"videos/clip.mp4"}));
}

// Missing bucket: an empty result and a warning, no source opened and no
// object created.
//
static void
test_store_no_bucket ()
{
  fake_source src (20000);
  fake_store st;
  st.log.has_bucket = false;

  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  bool finished (false);
  store_transfer_options o;
  o.on_finish = [&finished] (const string&) {finished = true;};

  optional<object_location> r (
    e.download_to_store (clip (), st, "nope", store_credentials (), o));

  assert (!r);
  assert (!finished);
  assert (src.opens == 0);
  assert (st.log.writers == 0);
  assert (st.log.objects.empty ());
  assert (diag.str ().find ("warning: bucket nope") == 0);
}

// Cancellation removes the partial object.
//
static void
test_store_abort ()
{
  fake_source src (20000);
  fake_store st;
  ostringstream diag;
  transfer_engine e (src, test_clock, diag);

  cancellation_token tok;

  store_transfer_options o;
  o.acl_policy = "private";
  o.cancel = &tok;
  o.on_progress = [&tok] (uint64_t, optional<uint64_t>, transfer_time_point)
  {
    tok.cancel ();
  };

  bool thrown (false);

  try
  {
    e.download_to_store (clip (), st, "media", store_credentials (), o);
  }
  catch (const transfer_aborted&)
  {
    thrown = true;
  }

  assert (thrown);
  assert (st.log.objects.empty ());
  assert (st.log.events.back () == "remove clip.mp4");

  for (const string& ev: st.log.events)
    assert (ev.compare (0, 4, "acl ") != 0);
}

// A failing read, upload or policy change is an I/O failure and whatever
// made it to the store is removed again.
//
static void
test_store_failure ()
{
  store_credentials cr;

  auto run = [&cr] (fake_source& src, fake_store& st, ostringstream& diag)
  {
    transfer_engine e (src, test_clock, diag);

    bool finished (false);
    store_transfer_options o;
    o.on_finish = [&finished] (const string&) {finished = true;};

    string what;

    try
    {
      e.download_to_store (clip (), st, "media", cr, o);
    }
    catch (const transfer_aborted&)
    {
      assert (false);
    }
    catch (const transfer_io_failure& x)
    {
      what = x.what ();
    }

    assert (!what.empty ());
    assert (!finished);
    return what;
  };

  // Read.
  //
  {
    fake_source src (20000);
    src.fail_after = 1;
    fake_store st;
    ostringstream diag;

    string w (run (src, st, diag));
    assert (w.find ("connection reset") != string::npos);

    assert ((st.log.events == vector<string> {
              "auth",
              "locate media",
              "create clip.mp4",
              "remove clip.mp4"}));
    assert (diag.str ().empty ());
  }

  // Upload.
  //
  {
    fake_source src (20000);
    fake_store st;
    st.log.fail_close = true;
    ostringstream diag;

    string w (run (src, st, diag));
    assert (w.find ("PUT failed") != string::npos);

    assert (st.log.objects.empty ());
    assert (st.log.events.back () == "remove clip.mp4");
  }

  // Policy: the object was uploaded and has to go.
  //
  {
    fake_source src (20000);
    fake_store st;
    st.log.fail_acl = true;
    ostringstream diag;

    string w (run (src, st, diag));
    assert (w.find ("PUT ACL failed") != string::npos);

    assert (st.log.objects.empty ());
    assert ((st.log.events == vector<string> {
              "auth",
              "locate media",
              "create clip.mp4",
              "close clip.mp4",
              "remove clip.mp4"}));
  }

  // Removal failing as well is a warning, the original error still wins.
  //
  {
    fake_source src (20000);
    fake_store st;
    st.log.fail_acl = true;
    st.log.fail_remove = true;
    ostringstream diag;

    string w (run (src, st, diag));
    assert (w.find ("PUT ACL failed") != string::npos);

    assert (st.log.objects.count ("clip.mp4") == 1);
    assert (diag.str ().find ("warning: unable to remove partial output") ==
            0);
  }
}

int
main ()
{
  test_file_download ();
  test_file_conflict ();
  test_file_path ();
  test_file_abort ();
  test_file_read_failure ();
  test_missing_size ();
  test_chunk_size ();
  test_object_key ();
  test_store_download ();
  test_store_no_bucket ();
  test_store_abort ();
  test_store_failure ();
}
