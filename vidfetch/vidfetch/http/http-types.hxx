#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <optional>

namespace vidfetch
{
  // HTTP method (verb).
  //
  // Only what we actually send: GET for the media stream and HEAD/PUT/DELETE
  // for the object store.
  //
  enum class http_method
  {
    get,
    head,
    put,
    delete_
  };

  std::string
  to_string (http_method);

  // HTTP status code.
  //
  // The enumerators cover the codes we look at. Anything else still
  // round-trips through the underlying integer.
  //
  enum class http_status : std::uint16_t
  {
    ok                 = 200,
    created            = 201,
    no_content         = 204,
    partial_content    = 206,

    moved_permanently  = 301,
    found              = 302,
    see_other          = 303,
    temporary_redirect = 307,
    permanent_redirect = 308,

    bad_request        = 400,
    forbidden          = 403,
    not_found          = 404,

    internal_server_error = 500
  };

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y) noexcept
  {
    return x.name == y.name && x.value == y.value;
  }

  template <typename S>
  inline bool
  operator!= (const basic_http_field<S>& x, const basic_http_field<S>& y) noexcept
  {
    return !(x == y);
  }

  // HTTP headers collection.
  //
  // Field order is preserved. Name lookups are case-insensitive (RFC 7230),
  // which matters to us because servers disagree on whether it is
  // Content-Length or content-length.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Get the first value of a header field or nullopt if not present.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const;

    // Remove all fields with the given name.
    //
    void
    remove (const string_type& name);

    void
    clear () noexcept
    {
      fields.clear ();
    }

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using iterator       = typename fields_type::iterator;
    using const_iterator = typename fields_type::const_iterator;

    iterator       begin ()       noexcept { return fields.begin (); }
    const_iterator begin () const noexcept { return fields.begin (); }
    iterator       end ()         noexcept { return fields.end (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  template <typename S>
  inline bool
  operator== (const basic_http_headers<S>& x, const basic_http_headers<S>& y) noexcept
  {
    return x.fields == y.fields;
  }

  template <typename S>
  inline bool
  operator!= (const basic_http_headers<S>& x, const basic_http_headers<S>& y) noexcept
  {
    return !(x == y);
  }

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // Case-insensitive ASCII comparison of header names.
  //
  bool
  header_name_equal (const std::string&, const std::string&) noexcept;

  // Parse a Content-Length value. Return nullopt unless the whole value is a
  // non-negative decimal integer (surrounding whitespace is tolerated).
  //
  std::optional<std::uint64_t>
  parse_content_length (const std::string&);

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    bool
    operator!= (const http_version& v) const noexcept
    {
      return !(*this == v);
    }
  };

  // Components of an absolute URL.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    // Value for the Host header: the port is only included if it is not the
    // scheme's default.
    //
    std::string
    authority () const;
  };

  // Split scheme://host[:port][/target]. A missing scheme means http, a
  // missing port the scheme's default, and a missing target "/".
  //
  // This handles what media hosts and S3 endpoints hand out. IPv6 literals
  // and user info are not supported.
  //
  url_parts
  parse_url (const std::string& url);

  // Resolve a Location value against the URL of the request that got it.
  //
  // An absolute reference is returned as is (without a fragment). A
  // scheme-relative one (//host/...) takes the base's scheme, a path-absolute
  // one (/...) its scheme and authority, and a relative path or a query
  // replaces the last path segment or the query of the base. Dot segments
  // are passed through for the server to deal with.
  //
  std::string
  resolve_url (const std::string& base, const std::string& reference);
}

#include <vidfetch/http/http-types.ixx>
