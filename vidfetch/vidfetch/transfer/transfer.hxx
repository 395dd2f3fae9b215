#pragma once

#include <vidfetch/transfer/transfer-types.hxx>
#include <vidfetch/transfer/transfer-sink.hxx>
#include <vidfetch/transfer/transfer-engine.hxx>

namespace vidfetch
{
  namespace transfer
  {
    using vidfetch::transfer_error;
    using vidfetch::destination_conflict;
    using vidfetch::transfer_aborted;
    using vidfetch::transfer_io_failure;

    using vidfetch::cancellation_token;
    using vidfetch::transfer_options;
    using vidfetch::file_transfer_options;
    using vidfetch::store_transfer_options;
    using vidfetch::object_location;

    using vidfetch::transfer_engine;
  }
}
