#include "audio_fitter.hpp"
#include "application/text_format.hpp"

namespace delivery_service {

AudioFitter::AudioFitter(int64_t ceiling_bytes, int64_t headroom_bytes, std::vector<int> ladder_kbps)
  : ceiling_(ceiling_bytes), headroom_(headroom_bytes), ladder_(std::move(ladder_kbps)) {}

std::expected<AudioPlan, AudioPlanError> AudioFitter::fit(std::optional<int64_t> duration_sec) const {
  if (!duration_sec || *duration_sec <= 0) {
    return std::unexpected(AudioPlanError{
      AudioPlanError::Kind::UnknownDuration,
      "Cannot determine duration, so I can't reliably estimate MP3 size."
    });
  }

  for (int kbps : ladder_) {
    int64_t estimate = *duration_sec * kbps * 1000 / 8;
    if (estimate + headroom_ <= ceiling_) {
      return AudioPlan{
        .bitrate_kbps = kbps,
        .estimated_bytes = estimate,
        .quality_label = "mp3 " + std::to_string(kbps) + "kbps"
      };
    }
  }

  return std::unexpected(AudioPlanError{
    AudioPlanError::Kind::AudioTooLarge,
    "Audio is too long to fit into " + formatBytes(ceiling_) + " even at low bitrate."
  });
}

}
