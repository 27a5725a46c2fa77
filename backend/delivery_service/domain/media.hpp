#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace delivery_service {

// One rendition as reported by the resolver. Absent numeric fields mean the
// resolver did not report them.
struct FormatInfo {
  std::string format_id;
  std::string ext;      // container extension like "mp4", "m4a", "webm"
  std::string vcodec;   // "none" when the rendition has no video stream
  std::string acodec;   // "none" when the rendition has no audio stream
  int height{0};
  double fps{0};
  double tbr{0};        // total bitrate, kbps
  double abr{0};        // audio bitrate, kbps
  std::optional<int64_t> filesize;
  std::optional<int64_t> filesize_approx;
  std::string url;

  // Unreported codecs count as present; only an explicit "none" rules a
  // stream out.
  bool hasVideo() const { return vcodec != "none"; }
  bool hasAudio() const { return acodec != "none"; }
};

struct MediaInfo {
  std::string title;
  std::optional<double> duration;  // seconds
  std::vector<FormatInfo> formats;
};

// Whole seconds of a positive duration, nullopt otherwise.
inline std::optional<int64_t> durationSeconds(const MediaInfo& info) {
  if (!info.duration || *info.duration <= 0) {
    return std::nullopt;
  }
  auto secs = static_cast<int64_t>(*info.duration);
  if (secs <= 0) {
    return std::nullopt;
  }
  return secs;
}

} // namespace delivery_service
