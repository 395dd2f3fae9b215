#include <vidfetch/store/s3-signer.hxx>

#include <ctime>
#include <cctype>
#include <vector>
#include <utility>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>

#include <openssl/hmac.h>

using namespace std;

namespace vidfetch
{
  // sha256_hasher
  //
  sha256_hasher::
  sha256_hasher ()
    : ctx_ (EVP_MD_CTX_new ())
  {
    if (ctx_ == nullptr)
      throw runtime_error ("unable to allocate digest context");

    if (EVP_DigestInit_ex (ctx_, EVP_sha256 (), nullptr) != 1)
    {
      EVP_MD_CTX_free (ctx_);
      throw runtime_error ("unable to initialize SHA-256 digest");
    }
  }

  sha256_hasher::
  ~sha256_hasher ()
  {
    EVP_MD_CTX_free (ctx_);
  }

  void sha256_hasher::
  update (const void* d, size_t n)
  {
    if (EVP_DigestUpdate (ctx_, d, n) != 1)
      throw runtime_error ("unable to update SHA-256 digest");
  }

  string sha256_hasher::
  finish ()
  {
    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx_, h, &n) != 1)
      throw runtime_error ("unable to finalize SHA-256 digest");

    if (EVP_DigestInit_ex (ctx_, EVP_sha256 (), nullptr) != 1)
      throw runtime_error ("unable to reset SHA-256 digest");

    return to_hex (string (reinterpret_cast<const char*> (h), n));
  }

  string
  sha256_hex (const string& s)
  {
    sha256_hasher h;
    h.update (s);
    return h.finish ();
  }

  string
  hmac_sha256 (const string& k, const string& d)
  {
    unsigned char r[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (HMAC (EVP_sha256 (),
              k.data (), static_cast<int> (k.size ()),
              reinterpret_cast<const unsigned char*> (d.data ()), d.size (),
              r, &n) == nullptr)
      throw runtime_error ("unable to compute HMAC-SHA256");

    return string (reinterpret_cast<const char*> (r), n);
  }

  string
  to_hex (const string& raw)
  {
    ostringstream o;
    for (unsigned char c: raw)
      o << hex << setw (2) << setfill ('0') << static_cast<int> (c);

    return o.str ();
  }

  string
  uri_encode (const string& s, bool encode_slash)
  {
    static const char digits[] = "0123456789ABCDEF";

    string r;
    r.reserve (s.size ());

    for (unsigned char c: s)
    {
      if (isalnum (c) || c == '-' || c == '_' || c == '.' || c == '~' ||
          (c == '/' && !encode_slash))
      {
        r += static_cast<char> (c);
      }
      else
      {
        r += '%';
        r += digits[c >> 4];
        r += digits[c & 0x0F];
      }
    }

    return r;
  }

  // Trim and collapse internal runs of spaces, as the canonical form
  // requires.
  //
  static string
  canonical_value (const string& v)
  {
    string r;
    bool space (false);

    for (char c: v)
    {
      if (c == ' ' || c == '\t')
      {
        space = !r.empty ();
        continue;
      }

      if (space)
      {
        r += ' ';
        space = false;
      }

      r += c;
    }

    return r;
  }

  static string
  lower (const string& s)
  {
    string r (s);
    transform (r.begin (), r.end (), r.begin (),
               [] (unsigned char c) {return static_cast<char> (tolower (c));});
    return r;
  }

  // Lowercased names with canonical values, sorted by name. Values of
  // repeated names are joined with commas.
  //
  static vector<pair<string, string>>
  canonical_headers (const http_headers& hs)
  {
    vector<pair<string, string>> r;

    for (const http_field& f: hs)
      r.emplace_back (lower (f.name), canonical_value (f.value));

    stable_sort (r.begin (), r.end (),
                 [] (const pair<string, string>& x,
                     const pair<string, string>& y)
                 {
                   return x.first < y.first;
                 });

    vector<pair<string, string>> m;
    for (auto& p: r)
    {
      if (!m.empty () && m.back ().first == p.first)
        m.back ().second += ',' + p.second;
      else
        m.push_back (move (p));
    }

    return m;
  }

  static string
  canonical_query (const string& q)
  {
    vector<pair<string, string>> ps;

    for (size_t b (0); b <= q.size (); )
    {
      size_t e (q.find ('&', b));
      if (e == string::npos)
        e = q.size ();

      if (e != b)
      {
        string p (q, b, e - b);
        size_t i (p.find ('='));

        if (i == string::npos)
          ps.emplace_back (move (p), string ());
        else
          ps.emplace_back (string (p, 0, i), string (p, i + 1));
      }

      b = e + 1;
    }

    sort (ps.begin (), ps.end ());

    string r;
    for (const auto& p: ps)
    {
      if (!r.empty ())
        r += '&';

      r += p.first;
      r += '=';
      r += p.second;
    }

    return r;
  }

  // s3_signer
  //
  s3_signer::
  s3_signer (store_credentials c, string r, string s)
    : credentials_ (move (c)), region_ (move (r)), service_ (move (s))
  {
  }

  string s3_signer::
  timestamp (chrono::system_clock::time_point t)
  {
    time_t tt (chrono::system_clock::to_time_t (t));

    tm u;
    if (gmtime_r (&tt, &u) == nullptr)
      throw runtime_error ("unable to convert signing time to UTC");

    char b[17];
    if (strftime (b, sizeof (b), "%Y%m%dT%H%M%SZ", &u) == 0)
      throw runtime_error ("unable to format signing time");

    return b;
  }

  string s3_signer::
  signing_key (const string& secret,
               const string& date,
               const string& region,
               const string& service)
  {
    string k (hmac_sha256 ("AWS4" + secret, date));
    k = hmac_sha256 (k, region);
    k = hmac_sha256 (k, service);
    return hmac_sha256 (k, "aws4_request");
  }

  string s3_signer::
  signed_headers (const http_headers& hs)
  {
    string r;
    for (const auto& p: canonical_headers (hs))
    {
      if (!r.empty ())
        r += ';';

      r += p.first;
    }

    return r;
  }

  string s3_signer::
  canonical_request (const string& method,
                     const string& target,
                     const http_headers& hs,
                     const string& payload_hash)
  {
    size_t q (target.find ('?'));

    string path (target, 0, q);
    if (path.empty ())
      path = "/";

    string query (q != string::npos ? string (target, q + 1) : string ());

    string r (method);
    r += '\n';
    r += path;
    r += '\n';
    r += canonical_query (query);
    r += '\n';

    for (const auto& p: canonical_headers (hs))
    {
      r += p.first;
      r += ':';
      r += p.second;
      r += '\n';
    }

    r += '\n';
    r += signed_headers (hs);
    r += '\n';
    r += payload_hash;

    return r;
  }

  string s3_signer::
  string_to_sign (const string& ts, const string& scope, const string& cr)
  {
    string r (algorithm);
    r += '\n';
    r += ts;
    r += '\n';
    r += scope;
    r += '\n';
    r += sha256_hex (cr);
    return r;
  }

  void s3_signer::
  sign (http_request& r,
        const string& payload_hash,
        chrono::system_clock::time_point t) const
  {
    string ts (timestamp (t));
    string date (ts, 0, 8);

    url_parts u (parse_url (r.url));

    if (!r.has_header ("Host"))
      r.set_header ("Host", u.authority ());

    r.set_header ("x-amz-date", ts);
    r.set_header ("x-amz-content-sha256", payload_hash);

    if (!credentials_.session_token.empty ())
      r.set_header ("x-amz-security-token", credentials_.session_token);

    http_headers hs;
    for (const http_field& f: r.headers)
    {
      string n (lower (f.name));

      if (n == "host" || n.compare (0, 6, "x-amz-") == 0)
        hs.add (f.name, f.value);
    }

    string scope (date + '/' + region_ + '/' + service_ + "/aws4_request");

    string sts (
      string_to_sign (ts,
                      scope,
                      canonical_request (to_string (r.method),
                                         u.target,
                                         hs,
                                         payload_hash)));

    string sig (
      to_hex (hmac_sha256 (
                signing_key (credentials_.secret_key, date, region_, service_),
                sts)));

    r.set_header ("Authorization",
                  string (algorithm) +
                  " Credential=" + credentials_.access_key + '/' + scope +
                  ", SignedHeaders=" + signed_headers (hs) +
                  ", Signature=" + sig);
  }
}
