#include <type_traits>

namespace vidfetch
{
  template <typename S, typename B>
  inline void basic_http_request<S, B>::
  normalize (const string_type& ua)
  {
    if (body &&
        !has_header (string_type ("Content-Length")) &&
        !has_header (string_type ("Transfer-Encoding")))
    {
      if constexpr (std::is_same<body_type, string_type>::value)
        set_header (string_type ("Content-Length"),
                    std::to_string (body->size ()));
    }

    // Required by HTTP/1.1. Note that the port is part of the value if it is
    // not the default one for the scheme (S3-compatible stores on custom
    // ports sign the Host header with the port included).
    //
    if (!has_header (string_type ("Host")))
    {
      string_type h (parse_url (url).authority ());
      if (!h.empty ())
        set_header (string_type ("Host"), std::move (h));
    }

    if (!has_header (string_type ("User-Agent")) && !ua.empty ())
      set_header (string_type ("User-Agent"), ua);
  }
}
