#pragma once

#include <memory>
#include <optional>
#include "domain/delivery_plan.hpp"
#include "domain/media.hpp"
#include "domain/media_resolver.hpp"

namespace delivery_service {

// Picks the best non-degraded video rendition and works out how sure we are
// of its final size. Never lowers quality to make a file fit.
class SizePlanner {
public:
  explicit SizePlanner(std::shared_ptr<SizeProber> prober);

  // Best rendition plus a live probe when metadata alone is not conclusive.
  DeliveryPlan plan(const MediaInfo& info) const;

  // Single-file first, then a video-only + audio-only pair, then unresolved.
  DeliveryPlan selectVideoPlan(const MediaInfo& info) const;

  // Rebuilds an unconfident plan with the summed probe totals when every
  // target answers. Any failure returns the plan unchanged.
  DeliveryPlan applyProbe(const DeliveryPlan& plan) const;

  static SizeEstimate estimateSize(const FormatInfo& format, std::optional<int64_t> duration_sec);

private:
  std::optional<SingleFilePlan> bestSingleFile(const MediaInfo& info) const;
  std::optional<PairedStreamPlan> bestPairedStreams(const MediaInfo& info) const;

  std::shared_ptr<SizeProber> prober_;
};

}
