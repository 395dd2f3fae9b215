#include <vidfetch/transfer/transfer-sink.hxx>

#include <system_error>

#include <vidfetch/transfer/transfer-types.hxx>

using namespace std;

namespace vidfetch
{
  // file_sink
  //
  void file_sink::
  open ()
  {
    ofs_.open (path_, ios::binary | ios::out | ios::trunc);

    if (!ofs_.is_open ())
      throw transfer_io_failure ("unable to open " + path_.string () +
                                 " for writing");

    created_ = true;
  }

  void file_sink::
  write (const char* d, size_t n)
  {
    ofs_.write (d, static_cast<streamsize> (n));

    if (!ofs_)
      throw transfer_io_failure ("unable to write to " + path_.string ());
  }

  void file_sink::
  close ()
  {
    ofs_.close ();

    if (ofs_.fail ())
      throw transfer_io_failure ("unable to close " + path_.string ());
  }

  bool file_sink::
  discard () noexcept
  {
    if (ofs_.is_open ())
      ofs_.close ();

    if (!created_)
      return true;

    created_ = false;

    error_code ec;
    fs::remove (path_, ec);
    return !ec;
  }

  // object_sink
  //
  void object_sink::
  open ()
  {
    writer_ = bucket_.create_object (key_);

    if (writer_ == nullptr)
      throw transfer_io_failure ("unable to create object " + key_ +
                                 " in bucket " + bucket_.name ());
  }

  void object_sink::
  write (const char* d, size_t n)
  {
    writer_->write (d, n);
  }

  void object_sink::
  close ()
  {
    writer_->close ();

    if (!policy_.empty ())
      writer_->set_access_policy (policy_);
  }

  bool object_sink::
  discard () noexcept
  {
    if (writer_ == nullptr)
      return true;

    unique_ptr<object_writer> w (move (writer_));

    try
    {
      w->remove ();
      return true;
    }
    catch (const exception&)
    {
      // Reported by the caller as a failed cleanup.
      //
      return false;
    }
  }
}
