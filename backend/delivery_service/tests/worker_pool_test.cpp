#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include "application/worker_pool.hpp"

using namespace delivery_service;

namespace {

DeliveryJob jobNamed(std::string id) {
  DeliveryJob job;
  job.job_id = std::move(id);
  job.plan = UnresolvedPlan{};
  return job;
}

}

TEST(WorkerPoolTest, RunsEveryQueuedJob) {
  JobQueue queue;
  std::mutex mtx;
  std::set<std::string> seen;
  {
    WorkerPool pool(queue, [&](const DeliveryJob& job) {
      std::lock_guard<std::mutex> lock{mtx};
      seen.insert(job.job_id);
      return JobStage::Delivered;
    }, 3);
    for (int i = 0; i < 20; ++i) {
      queue.push(jobNamed("j" + std::to_string(i)));
    }
    pool.shutdown();
    EXPECT_EQ(pool.completed(), 20u);
  }
  EXPECT_EQ(seen.size(), 20u);
}

TEST(WorkerPoolTest, FailingJobDoesNotStopWorker) {
  JobQueue queue;
  std::atomic<int> delivered{0};
  WorkerPool pool(queue, [&](const DeliveryJob& job) {
    if (job.job_id == "bad") {
      throw std::runtime_error("boom");
    }
    delivered.fetch_add(1);
    return JobStage::Delivered;
  }, 1);

  queue.push(jobNamed("bad"));
  queue.push(jobNamed("good"));
  pool.shutdown();

  EXPECT_EQ(delivered.load(), 1);
  EXPECT_EQ(pool.completed(), 2u);
}

TEST(WorkerPoolTest, SizeIsAtLeastOne) {
  JobQueue queue;
  WorkerPool pool(queue, [](const DeliveryJob&) { return JobStage::Delivered; }, 0);
  EXPECT_EQ(pool.size(), 1u);
}
