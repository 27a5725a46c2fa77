#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "application/status_reporter.hpp"
#include "domain/chat_client.hpp"

namespace delivery_service {

struct StatusUpdate {
  enum class Kind { Edit, Remove, Forget };
  Kind kind{Kind::Edit};
  int64_t chat_id{0};
  int64_t message_id{0};
  std::string text;
  InlineKeyboard keyboard;
  bool force{false};
};

// Ordered hand-off of status updates from running jobs to the reporter.
// Many producers (workers, the inbound handlers), one consumer.
class StatusChannel {
public:
  void publish(StatusUpdate update);

  // Blocks until an update is available. nullopt once closed and drained.
  std::optional<StatusUpdate> next();

  // Non-blocking variant of next().
  std::optional<StatusUpdate> tryNext();

  void close();

private:
  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<StatusUpdate> updates_;
  std::atomic_bool closed_{false};
};

// Applies every published update to the reporter, in publish order.
class StatusPump {
public:
  StatusPump(StatusChannel& channel, StatusReporter& reporter);
  ~StatusPump();

  StatusPump(const StatusPump&) = delete;
  StatusPump& operator=(const StatusPump&) = delete;

  void stop();

  static void apply(const StatusUpdate& update, StatusReporter& reporter);

private:
  void loop();

  StatusChannel& channel_;
  StatusReporter& reporter_;
  std::jthread thread_;
};

}
