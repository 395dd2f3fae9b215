#pragma once

#include <string>
#include <optional>
#include <ostream>

namespace vidfetch
{
  // Description of one downloadable video variant.
  //
  // The locator, base name and extension are always present. The quality and
  // codec attributes are optional and their absence is kept distinct from an
  // empty value. Nothing is validated on construction: a bad locator only
  // surfaces once we try to transfer it.
  //
  class media_descriptor
  {
  public:
    using optional_string = std::optional<std::string>;

    // What we print in place of an absent attribute.
    //
    static constexpr const char* absent = "none";

    media_descriptor (std::string locator,
                      std::string base_name,
                      std::string extension,
                      optional_string resolution = std::nullopt,
                      optional_string video_codec = std::nullopt,
                      optional_string profile = std::nullopt,
                      optional_string video_bitrate = std::nullopt,
                      optional_string audio_codec = std::nullopt,
                      optional_string audio_bitrate = std::nullopt);

    const std::string&
    locator () const noexcept {return locator_;}

    const std::string&
    base_name () const noexcept {return base_name_;}

    const std::string&
    extension () const noexcept {return extension_;}

    const optional_string&
    resolution () const noexcept {return resolution_;}

    const optional_string&
    video_codec () const noexcept {return video_codec_;}

    const optional_string&
    profile () const noexcept {return profile_;}

    const optional_string&
    video_bitrate () const noexcept {return video_bitrate_;}

    const optional_string&
    audio_codec () const noexcept {return audio_codec_;}

    const optional_string&
    audio_bitrate () const noexcept {return audio_bitrate_;}

    // Destination file name, that is, <base_name>.<extension>.
    //
    std::string
    file_name () const;

    // Ordering key, that is, "<extension> <resolution>".
    //
    std::string
    sort_key () const;

    // Compare by the ordering key. Return negative if this sorts before the
    // other descriptor, positive if after, and zero if the keys are equal.
    // Equal keys where only one resolution is absent (an explicit "none")
    // order the absent one first.
    //
    int
    compare (const media_descriptor&) const;

    // Human-readable representation for diagnostics. Not meant to be parsed
    // back.
    //
    std::string
    render () const;

  private:
    std::string locator_;
    std::string base_name_;
    std::string extension_;

    optional_string resolution_;
    optional_string video_codec_;
    optional_string profile_;
    optional_string video_bitrate_;
    optional_string audio_codec_;
    optional_string audio_bitrate_;
  };

  inline bool
  operator< (const media_descriptor& x, const media_descriptor& y)
  {
    return x.compare (y) < 0;
  }

  inline bool
  operator> (const media_descriptor& x, const media_descriptor& y)
  {
    return x.compare (y) > 0;
  }

  inline bool
  operator<= (const media_descriptor& x, const media_descriptor& y)
  {
    return x.compare (y) <= 0;
  }

  inline bool
  operator>= (const media_descriptor& x, const media_descriptor& y)
  {
    return x.compare (y) >= 0;
  }

  // Note that equality is in the ordering sense: two descriptors of the same
  // container and resolution compare equal even if their locators differ.
  //
  inline bool
  operator== (const media_descriptor& x, const media_descriptor& y)
  {
    return x.compare (y) == 0;
  }

  inline bool
  operator!= (const media_descriptor& x, const media_descriptor& y)
  {
    return x.compare (y) != 0;
  }

  inline std::ostream&
  operator<< (std::ostream& os, const media_descriptor& d)
  {
    return os << d.render ();
  }
}
