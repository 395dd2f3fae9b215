#pragma once

#include <string>
#include <memory>
#include <cstddef>
#include <fstream>
#include <filesystem>

#include <vidfetch/store/store-types.hxx>

namespace vidfetch
{
  namespace fs = std::filesystem;

  // Destination of a chunked copy.
  //
  // The copy calls open() once, write() per chunk, and then either close()
  // on success or discard() on any failure (including after a failed
  // close()). discard() must not throw.
  //
  class transfer_sink
  {
  public:
    virtual
    ~transfer_sink () = default;

    virtual void
    open () = 0;

    virtual void
    write (const char* data, std::size_t n) = 0;

    virtual void
    close () = 0;

    // Release the handle and delete partial output. Return false if the
    // output could not be deleted.
    //
    virtual bool
    discard () noexcept = 0;

    // What to report to the finish callback (path or key).
    //
    virtual std::string
    identifier () const = 0;
  };

  // Local file sink. The file is created (or truncated) by open().
  //
  class file_sink: public transfer_sink
  {
  public:
    explicit
    file_sink (fs::path p)
      : path_ (std::move (p)) {}

    file_sink (const file_sink&) = delete;
    file_sink& operator= (const file_sink&) = delete;

    void
    open () override;

    void
    write (const char*, std::size_t) override;

    void
    close () override;

    bool
    discard () noexcept override;

    std::string
    identifier () const override
    {
      return path_.string ();
    }

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

  private:
    fs::path path_;
    std::ofstream ofs_;
    bool created_ {false};
  };

  // Object store sink. The object writer is created by open(). close()
  // finalizes the object and then applies the access policy (if not
  // empty).
  //
  class object_sink: public transfer_sink
  {
  public:
    object_sink (store_bucket& b, std::string key, std::string policy)
      : bucket_ (b), key_ (std::move (key)), policy_ (std::move (policy)) {}

    object_sink (const object_sink&) = delete;
    object_sink& operator= (const object_sink&) = delete;

    void
    open () override;

    void
    write (const char*, std::size_t) override;

    void
    close () override;

    bool
    discard () noexcept override;

    std::string
    identifier () const override
    {
      return key_;
    }

  private:
    store_bucket& bucket_;
    std::string key_;
    std::string policy_;
    std::unique_ptr<object_writer> writer_;
  };
}
