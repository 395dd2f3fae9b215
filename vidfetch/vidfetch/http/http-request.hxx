#pragma once

#include <string>
#include <utility>
#include <optional>

#include <vidfetch/http/http-types.hxx>

namespace vidfetch
{
  // HTTP request.
  //
  template <typename S, typename B = S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_method               method {http_method::get};
    string_type               url;
    http_version              version;
    headers_type              headers;
    std::optional<body_type>  body;

    basic_http_request () = default;

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    basic_http_request (http_method m,
                        string_type u,
                        headers_type h,
                        http_version v = http_version (1, 1))
        : method (m),
          url (std::move (u)),
          version (v),
          headers (std::move (h)) {}

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    // Fill in Host, User-Agent and, for string bodies, Content-Length unless
    // already set.
    //
    void
    normalize (const string_type& user_agent);
  };

  using http_request = basic_http_request<std::string, std::string>;
}

#include <vidfetch/http/http-request.ixx>
