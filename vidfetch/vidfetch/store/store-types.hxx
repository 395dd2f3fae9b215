#pragma once

#include <string>
#include <memory>
#include <cstddef>

namespace vidfetch
{
  // Object store credentials.
  //
  // Empty region and endpoint mean the implementation's defaults.
  //
  struct store_credentials
  {
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    std::string region;
    std::string endpoint;
  };

  // Sequential writer of one object.
  //
  // Nothing is guaranteed to be visible in the store until close() returns.
  // A writer that is destroyed without close() or remove() discards what it
  // has staged.
  //
  class object_writer
  {
  public:
    virtual
    ~object_writer () = default;

    virtual void
    write (const char* data, std::size_t n) = 0;

    // Finalize the object.
    //
    virtual void
    close () = 0;

    // Apply a canned access control policy (for example, public-read) to
    // the closed object.
    //
    virtual void
    set_access_policy (const std::string& policy) = 0;

    // Delete whatever has been written so far, uploaded or not.
    //
    virtual void
    remove () = 0;
  };

  class store_bucket
  {
  public:
    virtual
    ~store_bucket () = default;

    virtual const std::string&
    name () const = 0;

    virtual std::unique_ptr<object_writer>
    create_object (const std::string& key) = 0;
  };

  class store_session
  {
  public:
    virtual
    ~store_session () = default;

    // Return nullptr if the bucket does not exist or is not accessible.
    //
    virtual std::unique_ptr<store_bucket>
    locate_bucket (const std::string& name) = 0;
  };

  class object_store
  {
  public:
    virtual
    ~object_store () = default;

    virtual std::unique_ptr<store_session>
    authenticate (const store_credentials&) = 0;
  };
}
