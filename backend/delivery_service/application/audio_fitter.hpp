#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "domain/delivery_plan.hpp"

namespace delivery_service {

struct AudioPlanError {
  enum class Kind { UnknownDuration, AudioTooLarge };
  Kind kind;
  std::string reason;
};

// Picks the highest mp3 bitrate whose encoded size plus headroom stays under
// the ceiling. There is no rung below the last one.
class AudioFitter {
public:
  AudioFitter(int64_t ceiling_bytes, int64_t headroom_bytes, std::vector<int> ladder_kbps);

  std::expected<AudioPlan, AudioPlanError> fit(std::optional<int64_t> duration_sec) const;

  int64_t ceiling() const { return ceiling_; }

private:
  int64_t ceiling_;
  int64_t headroom_;
  std::vector<int> ladder_;
};

}
