#pragma once

#include <string>
#include <variant>
#include "domain/chat_client.hpp"
#include "domain/delivery_plan.hpp"

namespace delivery_service {

// Button payloads: "dl|<mode>|<request id>" and "cnl|<job id>".
struct ModeSelection {
  std::string mode_tag;
  std::string request_id;
};

struct CancelRequest {
  std::string job_id;
};

struct MalformedToken {};

using CallbackToken = std::variant<ModeSelection, CancelRequest, MalformedToken>;

CallbackToken parseCallbackToken(const std::string& data);

std::string modeSelectionToken(DeliveryMode mode, const std::string& request_id);
std::string cancelToken(const std::string& job_id);

InlineKeyboard cancelKeyboard(const std::string& job_id);

}
