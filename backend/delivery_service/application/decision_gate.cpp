#include "decision_gate.hpp"

namespace delivery_service {

DeliveryDecision decide(const DeliveryPlan& video_plan,
                        const std::expected<AudioPlan, AudioPlanError>& audio,
                        int64_t ceiling_bytes) {
  DeliveryDecision decision{};
  if (audio) {
    decision.audio_plan = *audio;
  } else {
    decision.audio_reason = audio.error().reason;
  }

  auto size = sizeOf(video_plan);
  decision.video_size = size.bytes;

  if (!size.provenPositive()) {
    decision.verdict = DeliveryDecision::Verdict::VideoUnconfirmed;
    return decision;
  }

  if (*size.bytes > ceiling_bytes) {
    decision.verdict = DeliveryDecision::Verdict::VideoTooLarge;
    return decision;
  }

  decision.verdict = DeliveryDecision::Verdict::Offer;
  decision.video_plan = video_plan;
  return decision;
}

}
