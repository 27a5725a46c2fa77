#include "progress_tracker.hpp"
#include <algorithm>

namespace delivery_service {

int ProgressTracker::settle(int64_t numerator, int64_t denominator) {
  auto pct = static_cast<int>((numerator * 100) / denominator);
  pct = std::clamp(pct, 0, 99);
  last_percent_ = std::max(last_percent_, pct);
  return last_percent_;
}

ProgressReading ProgressTracker::update(const TransferSignal& signal) {
  if (signal.status == TransferSignal::Status::Finished) {
    last_percent_ = 100;
    return {100, std::nullopt, std::nullopt, true};
  }

  // Segmented transfers report fragments; their byte counters restart per
  // fragment batch and are not shown.
  if (signal.fragment_count && *signal.fragment_count > 0 && signal.fragment_index) {
    auto idx = std::clamp<int64_t>(*signal.fragment_index, 0, *signal.fragment_count);
    return {settle(idx, *signal.fragment_count), std::nullopt, std::nullopt, false};
  }

  const auto& downloaded = signal.downloaded_bytes;
  if (signal.total_bytes && *signal.total_bytes > 0 && downloaded && *downloaded >= 0) {
    return {settle(*downloaded, *signal.total_bytes), downloaded, signal.total_bytes, false};
  }

  if (signal.total_bytes_estimate && *signal.total_bytes_estimate > 0 && downloaded && *downloaded >= 0) {
    return {settle(*downloaded, *signal.total_bytes_estimate), downloaded, signal.total_bytes_estimate, false};
  }

  return {std::nullopt, downloaded, std::nullopt, false};
}

}
