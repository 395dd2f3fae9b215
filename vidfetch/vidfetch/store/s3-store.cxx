#include <vidfetch/store/s3-store.hxx>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <utility>
#include <stdexcept>
#include <filesystem>
#include <system_error>

#include <unistd.h> // mkstemp(), close()

#include <vidfetch/http/http-blocking.hxx>

#include <vidfetch/store/s3-signer.hxx>

using namespace std;

namespace vidfetch
{
  namespace fs = std::filesystem;

  string
  s3_url (const string& endpoint, const string& bucket, const string& key)
  {
    string r (endpoint);

    while (!r.empty () && r.back () == '/')
      r.pop_back ();

    r += '/';
    r += uri_encode (bucket, true);

    if (!key.empty ())
    {
      r += '/';
      r += uri_encode (key, false);
    }

    return r;
  }

  optional<string>
  s3_error_code (const string& body)
  {
    size_t b (body.find ("<Code>"));
    if (b == string::npos)
      return nullopt;

    b += 6;

    size_t e (body.find ("</Code>", b));
    if (e == string::npos)
      return nullopt;

    return string (body, b, e - b);
  }

  static string
  describe (const string& what, const http_response& r)
  {
    string m (what + " failed with status " + std::to_string (r.status_code ()));

    if (!r.reason.empty ())
      m += ' ' + r.reason;

    if (r.body)
    {
      if (optional<string> c = s3_error_code (*r.body))
        m += " (" + *c + ')';
    }

    return m;
  }

  namespace
  {
    class s3_session: public store_session
    {
    public:
      s3_session (http_client& c, const store_credentials& cr)
        : client_ (c),
          signer_ (cr, cr.region.empty () ? s3_store::default_region
                                           : cr.region),
          endpoint_ (cr.endpoint.empty () ? s3_store::default_endpoint
                                           : cr.endpoint)
      {
      }

      unique_ptr<store_bucket>
      locate_bucket (const string& name) override;

      const string&
      endpoint () const noexcept {return endpoint_;}

      // Sign and perform the request.
      //
      http_response
      execute (http_request r, const string& payload_hash)
      {
        signer_.sign (r, payload_hash, chrono::system_clock::now ());

        return run_blocking (client_.session ().io_context (),
                             client_.request (move (r)));
      }

      // Sign and perform the request with the body read from the file.
      //
      http_response
      upload (http_request r, const fs::path& body, const string& payload_hash)
      {
        signer_.sign (r, payload_hash, chrono::system_clock::now ());

        return run_blocking (client_.session ().io_context (),
                             client_.upload (move (r), body));
      }

    private:
      http_client& client_;
      s3_signer signer_;
      string endpoint_;
    };

    class s3_bucket: public store_bucket
    {
    public:
      s3_bucket (s3_session& s, string n)
        : session_ (s), name_ (move (n)) {}

      const string&
      name () const override {return name_;}

      unique_ptr<object_writer>
      create_object (const string& key) override;

    private:
      s3_session& session_;
      string name_;
    };

    // Object writer that stages the bytes in a temporary file and uploads
    // them with a single PUT on close. The payload hash that SigV4 needs up
    // front is computed while staging.
    //
    class s3_object_writer: public object_writer
    {
    public:
      s3_object_writer (s3_session&, string bucket, string key);
      ~s3_object_writer () override;

      void
      write (const char*, size_t) override;

      void
      close () override;

      void
      set_access_policy (const string&) override;

      void
      remove () override;

    private:
      string
      url () const
      {
        return s3_url (session_.endpoint (), bucket_, key_);
      }

      void
      drop_staging () noexcept;

    private:
      s3_session& session_;
      string bucket_;
      string key_;

      fs::path staging_;
      ofstream ofs_;
      sha256_hasher hasher_;
      bool uploaded_ {false};
    };

    // s3_session
    //
    unique_ptr<store_bucket> s3_session::
    locate_bucket (const string& name)
    {
      http_response r (
        execute (http_request (http_method::head, s3_url (endpoint_, name)),
                 sha256_hex ("")));

      if (r.is_success ())
        return make_unique<s3_bucket> (*this, name);

      // 301 means the bucket lives in another region, which for our
      // purposes is the same as not being able to find it.
      //
      switch (r.status)
      {
      case http_status::moved_permanently:
      case http_status::forbidden:
      case http_status::not_found:
        return nullptr;
      default:
        throw runtime_error (describe ("HEAD bucket " + name, r));
      }
    }

    // s3_bucket
    //
    unique_ptr<object_writer> s3_bucket::
    create_object (const string& key)
    {
      return make_unique<s3_object_writer> (session_, name_, key);
    }

    // s3_object_writer
    //
    s3_object_writer::
    s3_object_writer (s3_session& s, string b, string k)
      : session_ (s), bucket_ (move (b)), key_ (move (k))
    {
      string t ((fs::temp_directory_path () / "vidfetch-XXXXXX").string ());

      int fd (mkstemp (t.data ()));
      if (fd == -1)
        throw system_error (errno, generic_category (),
                            "unable to create staging file");

      ::close (fd);
      staging_ = t;

      ofs_.open (staging_, ios::binary | ios::out | ios::trunc);

      if (!ofs_.is_open ())
      {
        drop_staging ();
        throw runtime_error ("unable to open staging file " +
                             staging_.string ());
      }
    }

    s3_object_writer::
    ~s3_object_writer ()
    {
      drop_staging ();
    }

    void s3_object_writer::
    drop_staging () noexcept
    {
      if (ofs_.is_open ())
        ofs_.close ();

      if (!staging_.empty ())
      {
        error_code ec;
        fs::remove (staging_, ec);
        staging_.clear ();
      }
    }

    void s3_object_writer::
    write (const char* d, size_t n)
    {
      ofs_.write (d, static_cast<streamsize> (n));

      if (!ofs_)
        throw runtime_error ("unable to write staging file " +
                             staging_.string ());

      hasher_.update (d, n);
    }

    void s3_object_writer::
    close ()
    {
      ofs_.close ();

      if (ofs_.fail ())
        throw runtime_error ("unable to close staging file " +
                             staging_.string ());

      http_request rq (http_method::put, url ());
      rq.set_header ("Content-Type", "application/octet-stream");

      // From here on the object may exist in the store whatever the
      // outcome, so remove() must delete it.
      //
      uploaded_ = true;

      http_response r;

      try
      {
        r = session_.upload (move (rq), staging_, hasher_.finish ());
      }
      catch (const exception&)
      {
        drop_staging ();
        throw;
      }

      drop_staging ();

      if (!r.is_success ())
        throw runtime_error (describe ("PUT " + key_, r));
    }

    void s3_object_writer::
    set_access_policy (const string& policy)
    {
      http_request rq (http_method::put, url () + "?acl");
      rq.set_header ("x-amz-acl", policy);

      http_response r (session_.execute (move (rq), sha256_hex ("")));

      if (!r.is_success ())
        throw runtime_error (describe ("PUT ACL " + key_, r));
    }

    void s3_object_writer::
    remove ()
    {
      drop_staging ();

      if (!uploaded_)
        return;

      http_response r (
        session_.execute (http_request (http_method::delete_, url ()),
                          sha256_hex ("")));

      if (!r.is_success () && r.status != http_status::not_found)
        throw runtime_error (describe ("DELETE " + key_, r));

      uploaded_ = false;
    }
  }

  unique_ptr<store_session> s3_store::
  authenticate (const store_credentials& c)
  {
    if (c.access_key.empty () || c.secret_key.empty ())
      throw invalid_argument ("S3 access key and secret key are required");

    return make_unique<s3_session> (client_, c);
  }
}
