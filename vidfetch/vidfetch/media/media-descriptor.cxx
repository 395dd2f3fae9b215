#include <vidfetch/media/media-descriptor.hxx>

#include <sstream>
#include <utility>

using namespace std;

namespace vidfetch
{
  static inline const string&
  or_absent (const optional<string>& v)
  {
    static const string a (media_descriptor::absent);
    return v ? *v : a;
  }

  media_descriptor::
  media_descriptor (string locator,
                    string base_name,
                    string extension,
                    optional_string resolution,
                    optional_string video_codec,
                    optional_string profile,
                    optional_string video_bitrate,
                    optional_string audio_codec,
                    optional_string audio_bitrate)
    : locator_ (move (locator)),
      base_name_ (move (base_name)),
      extension_ (move (extension)),
      resolution_ (move (resolution)),
      video_codec_ (move (video_codec)),
      profile_ (move (profile)),
      video_bitrate_ (move (video_bitrate)),
      audio_codec_ (move (audio_codec)),
      audio_bitrate_ (move (audio_bitrate))
  {
  }

  string media_descriptor::
  file_name () const
  {
    return base_name_ + '.' + extension_;
  }

  string media_descriptor::
  sort_key () const
  {
    return extension_ + ' ' + or_absent (resolution_);
  }

  int media_descriptor::
  compare (const media_descriptor& d) const
  {
    // Plain lexicographic comparison of the rendered keys. This gives a total
    // order even if it is somewhat arbitrary semantically (e.g., "1080p"
    // sorts before "360p").
    //
    int r (sort_key ().compare (d.sort_key ()));

    // An absent resolution renders the same as an explicit "none" one. Keep
    // the two apart with the absent one first.
    //
    if (r == 0 && resolution_.has_value () != d.resolution_.has_value ())
      r = resolution_ ? 1 : -1;

    return r < 0 ? -1 : (r > 0 ? 1 : 0);
  }

  string media_descriptor::
  render () const
  {
    ostringstream o;
    o << "<video: " << or_absent (video_codec_)
      << " (." << extension_ << ")"
      << " - " << or_absent (resolution_)
      << " - " << or_absent (profile_) << '>';
    return o.str ();
  }
}
