#include "status_reporter.hpp"
#include <iostream>

namespace delivery_service {

StatusReporter::StatusReporter(std::shared_ptr<ChatClient> client,
                               std::chrono::milliseconds min_interval,
                               TimeSource now)
  : client_(std::move(client)),
    min_interval_(min_interval),
    now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })) {}

bool StatusReporter::edit(int64_t chat_id, int64_t message_id, const std::string& text,
                          const InlineKeyboard& keyboard, bool force) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto key = MessageKey{chat_id, message_id};
  auto now = now_();

  if (!force) {
    auto it = history_.find(key);
    if (it != history_.end()) {
      if (now - it->second.last_edit < min_interval_) {
        return false;
      }
      if (it->second.last_text == text) {
        return false;
      }
    }
  }

  auto res = client_->editMessageText(chat_id, message_id, text, keyboard);
  if (!res) {
    std::cerr << "[status] edit " << chat_id << "/" << message_id << " failed: " << res.error() << std::endl;
    return false;
  }
  history_[key] = EditHistory{now, text};
  return true;
}

void StatusReporter::remove(int64_t chat_id, int64_t message_id) {
  std::lock_guard<std::mutex> lock{mtx_};
  history_.erase(MessageKey{chat_id, message_id});
  auto res = client_->deleteMessage(chat_id, message_id);
  if (!res) {
    std::cerr << "[status] delete " << chat_id << "/" << message_id << " failed: " << res.error() << std::endl;
  }
}

std::optional<int64_t> StatusReporter::send(int64_t chat_id, const std::string& text,
                                            std::optional<int64_t> reply_to_message_id,
                                            const InlineKeyboard& keyboard) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto res = client_->sendMessage(chat_id, text, reply_to_message_id, keyboard);
  if (!res) {
    std::cerr << "[status] send to " << chat_id << " failed: " << res.error() << std::endl;
    return std::nullopt;
  }
  return *res;
}

void StatusReporter::answer(const std::string& callback_id, const std::string& text) {
  std::lock_guard<std::mutex> lock{mtx_};
  auto res = client_->answerCallback(callback_id, text);
  if (!res) {
    std::cerr << "[status] answer callback failed: " << res.error() << std::endl;
  }
}

void StatusReporter::forget(int64_t chat_id, int64_t message_id) {
  std::lock_guard<std::mutex> lock{mtx_};
  history_.erase(MessageKey{chat_id, message_id});
}

size_t StatusReporter::trackedMessages() const {
  std::lock_guard<std::mutex> lock{mtx_};
  return history_.size();
}

}
