#pragma once

#include <atomic>
#include <functional>
#include <thread>
#include <vector>
#include "application/job_queue.hpp"
#include "domain/job.hpp"

namespace delivery_service {

// Fixed set of workers blocking on the shared queue. Each worker runs one job
// to its terminal stage before taking the next; a failing job never takes its
// worker down.
class WorkerPool {
public:
  using JobHandler = std::function<JobStage(const DeliveryJob&)>;

  WorkerPool(JobQueue& queue, JobHandler handler, size_t size);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Stops the queue and waits for the workers to drain it.
  void shutdown();

  size_t size() const { return pool_size_; }
  size_t completed() const { return completed_.load(std::memory_order_acquire); }

private:
  void loop(size_t index);

  JobQueue& queue_;
  JobHandler handler_;
  std::vector<std::jthread> threads_;
  std::atomic<size_t> completed_{0};
  size_t pool_size_{0};
};

}
