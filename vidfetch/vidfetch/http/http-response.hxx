#pragma once

#include <string>
#include <utility>
#include <optional>

#include <vidfetch/http/http-types.hxx>

namespace vidfetch
{
  // HTTP response.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () : status (http_status::ok) {}

    explicit
    basic_http_response (http_status s)
      : status (s) {}

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }
  };

  using http_response = basic_http_response<std::string, std::string>;
}
