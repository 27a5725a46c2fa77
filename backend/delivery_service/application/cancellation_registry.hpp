#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace delivery_service {

// Advisory stop flag shared between the registry and one job. Setting it has
// no effect until the job reaches its next checkpoint.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic_bool>(false)) {}

  bool cancelled() const { return flag_->load(std::memory_order_acquire); }
  void cancel() const { flag_->store(true, std::memory_order_release); }

private:
  std::shared_ptr<std::atomic_bool> flag_;
};

struct CancellationEntry {
  CancellationToken token;
  int64_t user_id{0};
  int64_t chat_id{0};
  int64_t status_message_id{0};
};

enum class CancelOutcome { Requested, NotFound, NotOwner };

struct CancelResult {
  CancelOutcome outcome;
  std::optional<CancellationEntry> entry;  // set when Requested
};

class CancellationRegistry {
public:
  CancellationToken add(const std::string& job_id, int64_t user_id, int64_t chat_id, int64_t status_message_id);

  // Sets the flag when the job is live and `user_id` owns it.
  CancelResult requestCancel(const std::string& job_id, int64_t user_id);

  bool isCancelled(const std::string& job_id) const;

  std::optional<CancellationToken> tokenFor(const std::string& job_id) const;

  void release(const std::string& job_id);

  size_t size() const;

private:
  mutable std::mutex mtx_;
  std::unordered_map<std::string, CancellationEntry> entries_;
};

}
