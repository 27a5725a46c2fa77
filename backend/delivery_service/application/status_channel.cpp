#include "status_channel.hpp"

namespace delivery_service {

void StatusChannel::publish(StatusUpdate update) {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    if (closed_.load(std::memory_order_acquire)) {
      return;
    }
    updates_.push_back(std::move(update));
  }
  cv_.notify_one();
}

std::optional<StatusUpdate> StatusChannel::next() {
  std::unique_lock<std::mutex> lock{mtx_};
  cv_.wait(lock, [this]() -> bool {
    return closed_.load(std::memory_order_acquire) || !updates_.empty();
  });

  if (updates_.empty()) {
    return std::nullopt;
  }
  auto update = std::move(updates_.front());
  updates_.pop_front();
  return update;
}

std::optional<StatusUpdate> StatusChannel::tryNext() {
  std::lock_guard<std::mutex> lock{mtx_};
  if (updates_.empty()) {
    return std::nullopt;
  }
  auto update = std::move(updates_.front());
  updates_.pop_front();
  return update;
}

void StatusChannel::close() {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    closed_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

StatusPump::StatusPump(StatusChannel& channel, StatusReporter& reporter)
  : channel_(channel), reporter_(reporter) {
  thread_ = std::jthread([this]() { loop(); });
}

StatusPump::~StatusPump() {
  stop();
}

void StatusPump::stop() {
  channel_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StatusPump::apply(const StatusUpdate& update, StatusReporter& reporter) {
  switch (update.kind) {
    case StatusUpdate::Kind::Edit:
      reporter.edit(update.chat_id, update.message_id, update.text, update.keyboard, update.force);
      break;
    case StatusUpdate::Kind::Remove:
      reporter.remove(update.chat_id, update.message_id);
      break;
    case StatusUpdate::Kind::Forget:
      reporter.forget(update.chat_id, update.message_id);
      break;
  }
}

void StatusPump::loop() {
  while (auto update = channel_.next()) {
    apply(*update, reporter_);
  }
}

}
