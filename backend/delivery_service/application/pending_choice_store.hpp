#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "domain/delivery_plan.hpp"
#include "domain/job.hpp"

namespace delivery_service {

struct PendingChoice {
  std::chrono::steady_clock::time_point created_at;
  int64_t user_id{0};
  ChatContext chat;
  std::string url;
  std::string title;
  std::optional<DeliveryPlan> video_plan;  // also backs document delivery
  std::optional<AudioPlan> audio_plan;
};

enum class TakeError { Expired, NotOwner };

// Offers waiting for the user's single pick. Entries past the TTL are dropped
// lazily by sweep() and are never handed out by take() even before a sweep.
class PendingChoiceStore {
public:
  using Clock = std::chrono::steady_clock;
  using IdGenerator = std::function<std::string()>;

  explicit PendingChoiceStore(std::chrono::seconds ttl, IdGenerator id_generator = nullptr);

  // Stores the choice under a fresh random id and returns the id.
  std::string put(PendingChoice choice);

  // Removes and returns the entry if it is live and owned by `user_id`.
  // A foreign user leaves the entry in place.
  std::expected<PendingChoice, TakeError> take(const std::string& id, int64_t user_id,
                                               Clock::time_point now = Clock::now());

  // Drops every entry older than the TTL. Returns how many were dropped.
  size_t sweep(Clock::time_point now = Clock::now());

  size_t size() const;

private:
  bool expired(const PendingChoice& choice, Clock::time_point now) const;

  std::chrono::seconds ttl_;
  IdGenerator id_generator_;
  mutable std::mutex mtx_;
  std::unordered_map<std::string, PendingChoice> entries_;
};

// 18 hex characters from a random uuid.
std::string generateShortId();

}
