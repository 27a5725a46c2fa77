#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include "domain/chat_client.hpp"

namespace delivery_service {

// Single gateway for outbound chat calls. Every send, edit, delete and
// callback answer goes through one lock so the bot stays inside the
// platform's rate limits. Edits of the same message are throttled and
// deduplicated; failures are logged and dropped.
class StatusReporter {
public:
  using Clock = std::chrono::steady_clock;
  using TimeSource = std::function<Clock::time_point()>;

  StatusReporter(std::shared_ptr<ChatClient> client,
                 std::chrono::milliseconds min_interval,
                 TimeSource now = nullptr);

  // Returns true when the edit was sent and accepted. Without `force` the
  // edit is skipped when the text equals the last accepted text or the last
  // accepted edit is younger than the minimum interval.
  bool edit(int64_t chat_id, int64_t message_id, const std::string& text,
            const InlineKeyboard& keyboard = {}, bool force = false);

  void remove(int64_t chat_id, int64_t message_id);

  std::optional<int64_t> send(int64_t chat_id, const std::string& text,
                              std::optional<int64_t> reply_to_message_id = std::nullopt,
                              const InlineKeyboard& keyboard = {});

  void answer(const std::string& callback_id, const std::string& text);

  // Drops the throttle history of a message that will not be edited again.
  void forget(int64_t chat_id, int64_t message_id);

  size_t trackedMessages() const;

private:
  struct EditHistory {
    Clock::time_point last_edit;
    std::string last_text;
  };
  using MessageKey = std::pair<int64_t, int64_t>;

  std::shared_ptr<ChatClient> client_;
  std::chrono::milliseconds min_interval_;
  TimeSource now_;

  mutable std::mutex mtx_;
  std::map<MessageKey, EditHistory> history_;
};

}
