#pragma once
#include "delivery_plan.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace delivery_service {

struct ChatContext {
  int64_t chat_id{0};
  int64_t reply_to_message_id{0};
};

struct DeliveryJob {
  std::string job_id;
  ChatContext chat;
  int64_t status_message_id{0};
  int64_t user_id{0};
  std::string url;
  std::string title;
  DeliveryMode mode{DeliveryMode::Video};
  DeliveryPlan plan;
};

enum class JobStage {
  Queued,
  Fetching,
  Verifying,
  Delivering,
  Delivered,
  Refused,
  Errored,
  Cancelled
};

inline const char* stageName(JobStage stage) {
  switch (stage) {
    case JobStage::Queued: return "queued";
    case JobStage::Fetching: return "fetching";
    case JobStage::Verifying: return "verifying";
    case JobStage::Delivering: return "delivering";
    case JobStage::Delivered: return "delivered";
    case JobStage::Refused: return "refused";
    case JobStage::Errored: return "errored";
    case JobStage::Cancelled: return "cancelled";
  }
  return "unknown";
}

enum class FailureKind {
  SizeUnconfirmed,
  SizeExceeded,
  UnknownDuration,
  AudioTooLarge,
  TransferFailure,
  DeliveryFailure,
  Cancelled
};

// Why a stage stopped early. `message` is the short line shown to the user.
struct JobFailure {
  FailureKind kind;
  std::string message;
};

} // namespace delivery_service
