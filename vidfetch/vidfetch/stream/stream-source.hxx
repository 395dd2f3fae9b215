#pragma once

#include <string>
#include <memory>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <vidfetch/http/http-types.hxx>

namespace vidfetch
{
  // Readable byte stream.
  //
  class byte_stream
  {
  public:
    virtual
    ~byte_stream () = default;

    // Read up to n bytes into the buffer and return how many were read. Zero
    // means the stream is exhausted. Blocks until at least one byte is
    // available or the stream ends.
    //
    virtual std::size_t
    read (char* buffer, std::size_t n) = 0;
  };

  // What the source tells us about the stream besides its bytes.
  //
  struct stream_metadata
  {
    http_headers headers;

    // Size hint from the Content-Length field (looked up case-insensitively).
    // Absent if the source did not advertise it or the value is garbage.
    //
    std::optional<std::uint64_t>
    content_length () const
    {
      auto v (headers.get ("Content-Length"));
      return v ? parse_content_length (*v) : std::nullopt;
    }
  };

  struct opened_stream
  {
    std::unique_ptr<byte_stream> stream;
    stream_metadata metadata;
  };

  // Capability to open a locator for streaming read.
  //
  class stream_source
  {
  public:
    virtual
    ~stream_source () = default;

    virtual opened_stream
    open (const std::string& locator) = 0;
  };
}
