#include <vidfetch/http/http-types.hxx>
#include <vidfetch/http/http-request.hxx>
#include <vidfetch/http/http-response.hxx>

#include <string>
#include <cassert>

#include <vidfetch/stream/stream-source.hxx>

using namespace std;
using namespace vidfetch;

// Servers send Content-Length in whatever case they like.
//
static void
test_headers_case ()
{
  http_headers h;
  h.add ("content-length", "20000");
  h.add ("X-Thing", "a");

  assert (h.get ("Content-Length") && *h.get ("Content-Length") == "20000");
  assert (h.get ("CONTENT-LENGTH"));
  assert (h.contains ("x-thing"));
  assert (!h.get ("Content-Type"));

  // Set replaces regardless of case, add keeps duplicates.
  //
  h.set ("X-THING", "b");
  assert (h.size () == 2);
  assert (*h.get ("x-thing") == "b");

  h.add ("x-thing", "c");
  assert (h.size () == 3);
  assert (*h.get ("x-thing") == "b"); // First wins.

  h.remove ("X-Thing");
  assert (h.size () == 1);
  assert (!h.contains ("x-thing"));
}

static void
test_content_length ()
{
  assert (parse_content_length ("0") == 0u);
  assert (parse_content_length ("20000") == 20000u);
  assert (parse_content_length (" 42 ") == 42u);
  assert (parse_content_length ("18446744073709551615") ==
          18446744073709551615ull);

  assert (!parse_content_length (""));
  assert (!parse_content_length ("   "));
  assert (!parse_content_length ("-1"));
  assert (!parse_content_length ("+1"));
  assert (!parse_content_length ("12abc"));
  assert (!parse_content_length ("1 2"));
  assert (!parse_content_length ("18446744073709551616")); // Overflow.

  // The stream metadata looks the size hint up the same way.
  //
  stream_metadata m;
  assert (!m.content_length ());
  m.headers.add ("CONTENT-LENGTH", "8192");
  assert (m.content_length () == 8192u);

  stream_metadata g;
  g.headers.add ("Content-Length", "lots");
  assert (!g.content_length ());
}

static void
test_parse_url ()
{
  {
    url_parts u (parse_url ("http://x/v"));
    assert (u.scheme == "http");
    assert (u.host == "x");
    assert (u.port == "80");
    assert (u.target == "/v");
    assert (!u.secure ());
    assert (u.authority () == "x");
  }

  {
    url_parts u (parse_url ("HTTPS://s3.amazonaws.com"));
    assert (u.scheme == "https");
    assert (u.port == "443");
    assert (u.target == "/");
    assert (u.secure ());
  }

  {
    url_parts u (parse_url ("http://localhost:9000/bucket/dir/clip.mp4?acl"));
    assert (u.host == "localhost");
    assert (u.port == "9000");
    assert (u.target == "/bucket/dir/clip.mp4?acl");
    assert (u.authority () == "localhost:9000");
  }

  {
    url_parts u (parse_url ("example.com?x=1"));
    assert (u.scheme == "http");
    assert (u.host == "example.com");
    assert (u.target == "/?x=1");
  }
}

static void
test_request ()
{
  http_request r (http_method::put, "http://localhost:9000/b/k");
  r.body = "abc";
  r.normalize ("vidfetch-test");

  assert (*r.headers.get ("Host") == "localhost:9000");
  assert (*r.headers.get ("Content-Length") == "3");
  assert (*r.headers.get ("User-Agent") == "vidfetch-test");

  // Explicit headers are left alone.
  //
  http_request g (http_method::get, "https://x/v");
  g.set_header ("Host", "y");
  g.normalize ("");
  assert (*g.headers.get ("host") == "y");
  assert (!g.has_header ("User-Agent"));
  assert (!g.has_header ("Content-Length"));
}

// Location values the way servers and CDNs actually send them.
//
static void
test_resolve_url ()
{
  const string b ("http://127.0.0.1:18765/dir/v?sig=1");

  assert (resolve_url (b, "https://cdn.example.com/clip.mp4") ==
          "https://cdn.example.com/clip.mp4");

  assert (resolve_url (b, "/real.mp4") == "http://127.0.0.1:18765/real.mp4");
  assert (resolve_url (b, "/cdn/clip.mp4?sig=2") ==
          "http://127.0.0.1:18765/cdn/clip.mp4?sig=2");

  assert (resolve_url (b, "//cdn.example.com/clip.mp4") ==
          "http://cdn.example.com/clip.mp4");
  assert (resolve_url ("https://x/v", "//y:8443/w") == "https://y:8443/w");

  assert (resolve_url (b, "real.mp4") == "http://127.0.0.1:18765/dir/real.mp4");
  assert (resolve_url (b, "?sig=2") == "http://127.0.0.1:18765/dir/v?sig=2");
  assert (resolve_url ("https://x", "v.mp4") == "https://x/v.mp4");

  // Default ports stay implied and fragments are dropped.
  //
  assert (resolve_url ("https://x:443/a/b", "/c#t=10") == "https://x/c");
  assert (resolve_url (b, "") == b);

  // A scheme in the query is not a scheme.
  //
  assert (resolve_url (b, "/go?to=http://y/") ==
          "http://127.0.0.1:18765/go?to=http://y/");

  // What the result parses into is what we connect to.
  //
  url_parts u (parse_url (resolve_url (b, "/real.mp4")));
  assert (u.host == "127.0.0.1");
  assert (u.port == "18765");
  assert (u.target == "/real.mp4");
}

static void
test_method_status ()
{
  assert (to_string (http_method::get) == "GET");
  assert (to_string (http_method::delete_) == "DELETE");

  http_response r (http_status::see_other);
  assert (!r.is_success ());
  assert (http_response (http_status::no_content).is_success ());
  assert (http_response (static_cast<http_status> (418)).status_code () == 418);
}

int
main ()
{
  test_headers_case ();
  test_content_length ();
  test_parse_url ();
  test_request ();
  test_resolve_url ();
  test_method_status ();
}
