#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace delivery_service {

struct IncomingMessage {
  int64_t message_id{0};
  int64_t chat_id{0};
  std::string chat_type;   // "private", "group", "supergroup", "channel"
  std::string chat_title;
  int64_t user_id{0};
  std::string username;
  std::string text;        // text or caption
};

struct CallbackQuery {
  std::string id;
  int64_t user_id{0};
  std::string data;
  std::optional<int64_t> chat_id;
  std::optional<int64_t> message_id;
};

} // namespace delivery_service
