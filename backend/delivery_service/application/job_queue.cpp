#include "job_queue.hpp"

namespace delivery_service {

size_t JobQueue::push(DeliveryJob job) {
  size_t position = 0;
  {
    std::lock_guard<std::mutex> lock{mtx_};
    jobs_.push(std::move(job));
    position = jobs_.size();
  }
  cv_.notify_one();
  return position;
}

std::optional<DeliveryJob> JobQueue::pop() {
  std::unique_lock<std::mutex> lock{mtx_};
  cv_.wait(lock, [this]() -> bool {
    return stop_.load(std::memory_order_acquire) || !jobs_.empty();
  });

  if (stop_.load(std::memory_order_acquire) && jobs_.empty()) {
    return std::nullopt;
  }

  auto job = std::move(jobs_.front());
  jobs_.pop();
  return job;
}

void JobQueue::stop() {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    stop_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return jobs_.size();
}

}
