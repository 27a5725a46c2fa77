#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include "application/audio_fitter.hpp"
#include "domain/delivery_plan.hpp"

namespace delivery_service {

// What may be offered for one URL. Video and document share `video_plan`.
struct DeliveryDecision {
  enum class Verdict {
    Offer,             // proven to fit: video, document and audio (if any)
    VideoTooLarge,     // proven not to fit: audio alone, if any
    VideoUnconfirmed   // size could not be proven: audio alone, if any
  };

  Verdict verdict;
  std::optional<DeliveryPlan> video_plan;
  std::optional<AudioPlan> audio_plan;
  std::optional<std::string> audio_reason;
  std::optional<int64_t> video_size;

  bool offersVideo() const { return video_plan.has_value(); }
  bool offersAudio() const { return audio_plan.has_value(); }
  bool offersAnything() const { return offersVideo() || offersAudio(); }
};

// A video plan is only ever offered when its size is confident, positive and
// within the ceiling. Audio plans are confident by construction.
DeliveryDecision decide(const DeliveryPlan& video_plan,
                        const std::expected<AudioPlan, AudioPlanError>& audio,
                        int64_t ceiling_bytes);

}
