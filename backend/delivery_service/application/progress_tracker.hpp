#pragma once

#include <cstdint>
#include <optional>
#include "domain/media_resolver.hpp"

namespace delivery_service {

struct ProgressReading {
  std::optional<int> percent;
  std::optional<int64_t> downloaded;
  std::optional<int64_t> total;  // may be the resolver's estimate, display only
  bool finished{false};
};

// Turns raw transfer signals of one job into a display percentage that never
// goes down and stays at 99 or below until the transfer reports it finished.
class ProgressTracker {
public:
  ProgressReading update(const TransferSignal& signal);

private:
  int settle(int64_t numerator, int64_t denominator);

  int last_percent_{0};
};

}
