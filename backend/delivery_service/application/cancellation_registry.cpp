#include "cancellation_registry.hpp"

namespace delivery_service {

CancellationToken CancellationRegistry::add(const std::string& job_id, int64_t user_id,
                                            int64_t chat_id, int64_t status_message_id) {
  CancellationEntry entry{
    .token = CancellationToken{},
    .user_id = user_id,
    .chat_id = chat_id,
    .status_message_id = status_message_id
  };
  std::lock_guard<std::mutex> lock{mtx_};
  auto [it, inserted] = entries_.insert_or_assign(job_id, entry);
  return it->second.token;
}

CancelResult CancellationRegistry::requestCancel(const std::string& job_id, int64_t user_id) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = entries_.find(job_id);
  if (it == entries_.end()) {
    return {CancelOutcome::NotFound, std::nullopt};
  }
  if (it->second.user_id != user_id) {
    return {CancelOutcome::NotOwner, std::nullopt};
  }
  it->second.token.cancel();
  return {CancelOutcome::Requested, it->second};
}

bool CancellationRegistry::isCancelled(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = entries_.find(job_id);
  return it != entries_.end() && it->second.token.cancelled();
}

std::optional<CancellationToken> CancellationRegistry::tokenFor(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = entries_.find(job_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.token;
}

void CancellationRegistry::release(const std::string& job_id) {
  std::lock_guard<std::mutex> lock{mtx_};
  entries_.erase(job_id);
}

size_t CancellationRegistry::size() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return entries_.size();
}

}
