#pragma once

#include <chrono>
#include <string>
#include <cstddef>

#include <openssl/evp.h>

#include <vidfetch/http/http-types.hxx>
#include <vidfetch/http/http-request.hxx>

#include <vidfetch/store/store-types.hxx>

namespace vidfetch
{
  // Incremental SHA-256 over an OpenSSL digest context.
  //
  class sha256_hasher
  {
  public:
    sha256_hasher ();
    ~sha256_hasher ();

    sha256_hasher (const sha256_hasher&) = delete;
    sha256_hasher& operator= (const sha256_hasher&) = delete;

    void
    update (const void* data, std::size_t n);

    void
    update (const std::string& s)
    {
      update (s.data (), s.size ());
    }

    // Finish and return the lowercase hex digest. The hasher is reset and
    // can be reused.
    //
    std::string
    finish ();

  private:
    EVP_MD_CTX* ctx_;
  };

  // Lowercase hex SHA-256 of the data.
  //
  std::string
  sha256_hex (const std::string&);

  // Raw (binary) HMAC-SHA256.
  //
  std::string
  hmac_sha256 (const std::string& key, const std::string& data);

  std::string
  to_hex (const std::string& raw);

  // Percent-encode everything except the RFC 3986 unreserved characters
  // and, unless encode_slash is true, '/'.
  //
  std::string
  uri_encode (const std::string&, bool encode_slash);

  // AWS Signature Version 4.
  //
  // Only what an S3 client needs: the payload hash is passed in (it is
  // computed while the object is staged), and the signed headers are Host
  // plus every x-amz-* header of the request.
  //
  class s3_signer
  {
  public:
    static constexpr const char* algorithm = "AWS4-HMAC-SHA256";

    s3_signer (store_credentials credentials,
               std::string region,
               std::string service = "s3");

    // Add x-amz-date, x-amz-content-sha256, x-amz-security-token (if there
    // is a session token) and Authorization to the request.
    //
    void
    sign (http_request&,
          const std::string& payload_hash,
          std::chrono::system_clock::time_point) const;

    const std::string&
    region () const noexcept {return region_;}

    // The building blocks, exposed for testing against published vectors.
    //

    // YYYYMMDD'T'HHMMSS'Z' in UTC.
    //
    static std::string
    timestamp (std::chrono::system_clock::time_point);

    static std::string
    signing_key (const std::string& secret,
                 const std::string& date,
                 const std::string& region,
                 const std::string& service);

    // Sorted lowercase header names joined with ';'.
    //
    static std::string
    signed_headers (const http_headers&);

    // All the given headers are signed. The target is the already encoded
    // path with an optional query.
    //
    static std::string
    canonical_request (const std::string& method,
                       const std::string& target,
                       const http_headers&,
                       const std::string& payload_hash);

    static std::string
    string_to_sign (const std::string& timestamp,
                    const std::string& scope,
                    const std::string& canonical_request);

  private:
    store_credentials credentials_;
    std::string region_;
    std::string service_;
  };
}
