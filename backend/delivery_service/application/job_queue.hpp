#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include "domain/job.hpp"

namespace delivery_service {

// Unbounded FIFO shared by every worker. Jobs leave in arrival order.
class JobQueue {
public:
  // Returns the queue position of the new job, counting from 1.
  size_t push(DeliveryJob job);

  // Blocks until a job is available. nullopt once stopped and drained.
  std::optional<DeliveryJob> pop();

  void stop();

  size_t size() const;

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<DeliveryJob> jobs_;
  std::atomic_bool stop_{false};
};

}
