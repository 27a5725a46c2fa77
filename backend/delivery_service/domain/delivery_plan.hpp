#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace delivery_service {

// A byte size and whether it is backed by declared metadata or a live probe.
// Bitrate-derived guesses are never confident.
struct SizeEstimate {
  std::optional<int64_t> bytes;
  bool confident{false};

  bool provenPositive() const { return confident && bytes && *bytes > 0; }
};

// Video and audio muxed in one rendition.
struct SingleFilePlan {
  std::string format_id;
  SizeEstimate size;
  std::vector<std::string> probe_targets;
  std::string quality_label;
};

// Separate video-only and audio-only renditions merged after the fetch.
struct PairedStreamPlan {
  std::string video_format_id;
  std::string audio_format_id;
  std::string merge_format;
  SizeEstimate size;
  std::vector<std::string> probe_targets;
  std::string quality_label;
};

// No usable rendition metadata. Always fails the size gate.
struct UnresolvedPlan {
  std::string quality_label{"best"};
};

// Audio extraction at a bitrate chosen so that the encoded size fits.
// Only ever constructed when it fits, so its size is always confident.
struct AudioPlan {
  int bitrate_kbps{0};
  int64_t estimated_bytes{0};
  std::string quality_label;
};

using DeliveryPlan = std::variant<SingleFilePlan, PairedStreamPlan, UnresolvedPlan, AudioPlan>;

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// Selector string the resolver understands.
inline std::string fetchSpec(const DeliveryPlan& plan) {
  return std::visit(overloaded{
    [](const SingleFilePlan& p) { return p.format_id; },
    [](const PairedStreamPlan& p) { return p.video_format_id + "+" + p.audio_format_id; },
    [](const UnresolvedPlan&) { return std::string("best"); },
    [](const AudioPlan&) { return std::string("bestaudio/best"); },
  }, plan);
}

inline std::optional<std::string> mergeFormat(const DeliveryPlan& plan) {
  if (const auto* p = std::get_if<PairedStreamPlan>(&plan)) {
    return p->merge_format;
  }
  return std::nullopt;
}

inline SizeEstimate sizeOf(const DeliveryPlan& plan) {
  return std::visit(overloaded{
    [](const SingleFilePlan& p) { return p.size; },
    [](const PairedStreamPlan& p) { return p.size; },
    [](const UnresolvedPlan&) { return SizeEstimate{}; },
    [](const AudioPlan& p) { return SizeEstimate{p.estimated_bytes, true}; },
  }, plan);
}

inline std::string qualityLabel(const DeliveryPlan& plan) {
  return std::visit([](const auto& p) { return p.quality_label; }, plan);
}

inline std::vector<std::string> probeTargets(const DeliveryPlan& plan) {
  return std::visit(overloaded{
    [](const SingleFilePlan& p) { return p.probe_targets; },
    [](const PairedStreamPlan& p) { return p.probe_targets; },
    [](const UnresolvedPlan&) { return std::vector<std::string>{}; },
    [](const AudioPlan&) { return std::vector<std::string>{}; },
  }, plan);
}

enum class DeliveryMode { Video, Document, Audio };

inline std::string modeTag(DeliveryMode mode) {
  switch (mode) {
    case DeliveryMode::Video: return "video";
    case DeliveryMode::Document: return "doc";
    case DeliveryMode::Audio: return "audio";
  }
  return "video";
}

inline std::optional<DeliveryMode> modeFromTag(const std::string& tag) {
  if (tag == "video") return DeliveryMode::Video;
  if (tag == "doc") return DeliveryMode::Document;
  if (tag == "audio") return DeliveryMode::Audio;
  return std::nullopt;
}

} // namespace delivery_service
