#include "pending_choice_store.hpp"
#include <uuid/uuid.h>

namespace delivery_service {

std::string generateShortId() {
  uuid_t uuid;
  uuid_generate_random(uuid);
  static const char hex[] = "0123456789abcdef";
  std::string id;
  id.reserve(18);
  for (size_t i = 0; i < 9; ++i) {
    id.push_back(hex[uuid[i] >> 4]);
    id.push_back(hex[uuid[i] & 0x0F]);
  }
  return id;
}

PendingChoiceStore::PendingChoiceStore(std::chrono::seconds ttl, IdGenerator id_generator)
  : ttl_(ttl), id_generator_(id_generator ? std::move(id_generator) : IdGenerator(generateShortId)) {}

std::string PendingChoiceStore::put(PendingChoice choice) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto id = id_generator_();
  while (entries_.contains(id)) {
    id = id_generator_();
  }
  entries_.emplace(id, std::move(choice));
  return id;
}

std::expected<PendingChoice, TakeError> PendingChoiceStore::take(const std::string& id, int64_t user_id,
                                                                 Clock::time_point now) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::unexpected(TakeError::Expired);
  }
  if (expired(it->second, now)) {
    entries_.erase(it);
    return std::unexpected(TakeError::Expired);
  }
  if (it->second.user_id != user_id) {
    return std::unexpected(TakeError::NotOwner);
  }
  auto choice = std::move(it->second);
  entries_.erase(it);
  return choice;
}

size_t PendingChoiceStore::sweep(Clock::time_point now) {
  std::lock_guard<std::mutex> lock{mtx_};
  return std::erase_if(entries_, [&](const auto& entry) {
    return expired(entry.second, now);
  });
}

size_t PendingChoiceStore::size() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return entries_.size();
}

bool PendingChoiceStore::expired(const PendingChoice& choice, Clock::time_point now) const {
  return now - choice.created_at > ttl_;
}

}
