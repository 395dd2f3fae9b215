#include <vidfetch/http/http-types.hxx>

#include <cctype>
#include <charconv>
#include <algorithm>

using namespace std;

namespace vidfetch
{
  // http_method
  //
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return "GET";
      case http_method::head:    return "HEAD";
      case http_method::put:     return "PUT";
      case http_method::delete_: return "DELETE";
    }
    return "GET";
  }

  bool
  header_name_equal (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i < x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  optional<uint64_t>
  parse_content_length (const string& v)
  {
    size_t b (v.find_first_not_of (" \t"));
    if (b == string::npos)
      return nullopt;

    size_t e (v.find_last_not_of (" \t") + 1);

    // Note that we use from_chars for locale-independent parsing. It also
    // rejects a leading sign for unsigned types which is what we want.
    //
    uint64_t n (0);
    auto r (from_chars (v.data () + b, v.data () + e, n));

    if (r.ec != errc () || r.ptr != v.data () + e)
      return nullopt;

    return n;
  }

  // url_parts
  //
  string url_parts::
  authority () const
  {
    bool def ((scheme == "https" && port == "443") ||
              (scheme == "http"  && port == "80"));

    return def ? host : host + ':' + port;
  }

  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      transform (r.scheme.begin (), r.scheme.end (), r.scheme.begin (),
                 [] (unsigned char c) {return static_cast<char> (tolower (c));});
      pos = p + 3;
    }
    else
      r.scheme = "http";

    // The authority ends at the start of the path or query, or at the end of
    // the string.
    //
    size_t end (url.find_first_of ("/?", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
      r.host = auth;

    if (r.port.empty ())
      r.port = r.secure () ? "443" : "80";

    if (end < url.size ())
    {
      r.target = url.substr (end);

      if (r.target[0] == '?')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  string
  resolve_url (const string& base, const string& ref)
  {
    string r (ref, 0, ref.find ('#'));

    if (r.empty ())
      return base;

    // Absolute if there is a scheme, that is, :// before any path, query or
    // fragment.
    //
    size_t p (r.find ("://"));
    if (p != string::npos && p < r.find_first_of ("/?"))
      return r;

    url_parts b (parse_url (base));

    if (r.compare (0, 2, "//") == 0)
      return b.scheme + ':' + r;

    string origin (b.scheme + "://" + b.authority ());

    if (r[0] == '/')
      return origin + r;

    string path (b.target, 0, b.target.find ('?'));

    if (r[0] == '?')
      return origin + path + r;

    // The target always starts with a slash so there is a last segment to
    // replace, possibly empty.
    //
    path.erase (path.rfind ('/') + 1);
    return origin + path + r;
  }
}
