#pragma once

#include <string>
#include <iosfwd>
#include <optional>
#include <filesystem>

#include <vidfetch/media/media-descriptor.hxx>
#include <vidfetch/stream/stream-source.hxx>
#include <vidfetch/store/store-types.hxx>
#include <vidfetch/transfer/transfer-types.hxx>
#include <vidfetch/transfer/transfer-sink.hxx>

namespace vidfetch
{
  namespace fs = std::filesystem;

  // Streamed transfer of a media descriptor's bytes to a local file or to an
  // object store bucket.
  //
  // Both destinations share one copy loop: read up to chunk_size bytes from
  // the source, write them to the sink, report progress, until the source
  // is exhausted. Cancellation is polled between chunks. On any failure
  // (cancellation included) the partial output is deleted before the
  // exception propagates.
  //
  // Warnings (missing size hint, bucket not found, failed cleanup) are
  // written to the diagnostics stream as "warning: ..." lines.
  //
  class transfer_engine
  {
  public:
    explicit
    transfer_engine (stream_source&);

    transfer_engine (stream_source&, std::ostream& diag);

    transfer_engine (stream_source&,
                     const transfer_clock&,
                     std::ostream& diag);

    transfer_engine (const transfer_engine&) = delete;
    transfer_engine& operator= (const transfer_engine&) = delete;

    // Download into the destination, which is either an existing directory
    // (the file is then named after the descriptor) or the file path
    // itself. Return the path written.
    //
    // Throw destination_conflict if the path exists and force_overwrite is
    // false, transfer_aborted if cancelled, and transfer_io_failure on any
    // other failure. Throw std::invalid_argument if chunk_size is zero.
    //
    fs::path
    download_to_file (const media_descriptor&,
                      const fs::path& destination,
                      const file_transfer_options& = file_transfer_options ());

    // Download into the bucket under <remote_dir>/<base_name>.<extension>.
    // On success the access policy is applied and then the finish callback
    // is called with the key.
    //
    // Return nullopt (and write a warning) if the bucket cannot be located,
    // in which case neither the source nor any object is opened. Otherwise
    // throw as download_to_file().
    //
    std::optional<object_location>
    download_to_store (const media_descriptor&,
                       object_store&,
                       const std::string& bucket,
                       const store_credentials&,
                       const store_transfer_options& = store_transfer_options ());

    // Resolve the local destination path.
    //
    static fs::path
    resolve_path (const media_descriptor&, const fs::path& destination);

    // Resolve the object key. Trailing slashes in the directory are
    // collapsed.
    //
    static std::string
    object_key (const media_descriptor&, const std::string& remote_dir);

  private:
    // Copy the locator's bytes into the sink. Return the transfer state as
    // of completion.
    //
    transfer_state
    copy (const std::string& locator,
          transfer_sink&,
          const transfer_options&);

    void
    discard (transfer_sink&) noexcept;

  private:
    stream_source& source_;
    const transfer_clock& clock_;
    std::ostream& diag_;
  };
}
