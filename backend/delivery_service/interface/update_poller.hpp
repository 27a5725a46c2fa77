#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include "infrastructure/telegram_client.hpp"
#include "interface/update_dispatcher.hpp"

namespace delivery_service {

// Long-polling inbound loop. The offset only moves past updates that were
// handed to the sink.
class UpdatePoller {
public:
  UpdatePoller(std::shared_ptr<TelegramClient> client, UpdateSink& sink,
               std::chrono::seconds poll_timeout,
               std::chrono::seconds error_backoff = std::chrono::seconds{3});

  void run(std::stop_token stop);

  int64_t offset() const { return offset_; }

private:
  void pause(std::stop_token& stop, std::chrono::seconds duration);

  std::shared_ptr<TelegramClient> client_;
  UpdateSink& sink_;
  std::chrono::seconds poll_timeout_;
  std::chrono::seconds error_backoff_;
  int64_t offset_{0};
};

}
