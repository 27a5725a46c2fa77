#include "worker_pool.hpp"
#include <iostream>

namespace delivery_service {

WorkerPool::WorkerPool(JobQueue& queue, JobHandler handler, size_t size)
  : queue_(queue), handler_(std::move(handler)) {
  pool_size_ = size < 1 ? 1 : size;
  threads_.reserve(pool_size_);

  for (size_t i = 0; i < pool_size_; i++) {
    threads_.emplace_back([this, i]() -> void { loop(i); });
  }
}

WorkerPool::~WorkerPool() {
  shutdown();
}

void WorkerPool::shutdown() {
  queue_.stop();
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

void WorkerPool::loop(size_t index) {
  while (auto job = queue_.pop()) {
    try {
      auto terminal = handler_(*job);
      std::cout << "[worker " << index << "] job " << job->job_id
                << " finished: " << stageName(terminal) << std::endl;
    } catch (const std::exception& e) {
      std::cerr << "[worker " << index << "] job " << job->job_id
                << " crashed: " << e.what() << std::endl;
    }
    completed_.fetch_add(1, std::memory_order_acq_rel);
  }
}

}
