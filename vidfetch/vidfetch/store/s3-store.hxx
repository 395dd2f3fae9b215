#pragma once

#include <string>
#include <memory>
#include <optional>

#include <vidfetch/http/http-client.hxx>

#include <vidfetch/store/store-types.hxx>

namespace vidfetch
{
  // S3-compatible object store over our HTTP client.
  //
  // Requests are signed with SigV4 and use path-style addressing
  // (<endpoint>/<bucket>/<key>), which every S3-compatible server accepts.
  // Authentication is local: the credentials are only checked for presence
  // here and are validated by the server on the first request.
  //
  class s3_store: public object_store
  {
  public:
    static constexpr const char* default_region = "us-east-1";
    static constexpr const char* default_endpoint = "https://s3.amazonaws.com";

    explicit
    s3_store (http_client& c)
      : client_ (c) {}

    std::unique_ptr<store_session>
    authenticate (const store_credentials&) override;

  private:
    http_client& client_;
  };

  // Path-style URL of a bucket (empty key) or an object. The key is
  // percent-encoded except for its slashes.
  //
  std::string
  s3_url (const std::string& endpoint,
          const std::string& bucket,
          const std::string& key = std::string ());

  // Extract <Code> from an S3 XML error body, if any.
  //
  std::optional<std::string>
  s3_error_code (const std::string& body);
}
