#include "update_poller.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace delivery_service {

UpdatePoller::UpdatePoller(std::shared_ptr<TelegramClient> client, UpdateSink& sink,
                           std::chrono::seconds poll_timeout,
                           std::chrono::seconds error_backoff)
  : client_(std::move(client)), sink_(sink), poll_timeout_(poll_timeout), error_backoff_(error_backoff) {}

void UpdatePoller::run(std::stop_token stop) {
  std::cout << "[poller] started" << std::endl;
  while (!stop.stop_requested()) {
    auto updates = client_->getUpdates(offset_, poll_timeout_);
    if (!updates) {
      std::cerr << "[poller] " << updates.error() << std::endl;
      pause(stop, error_backoff_);
      continue;
    }

    for (auto& update : *updates) {
      offset_ = std::max(offset_, update.update_id + 1);
      sink_.dispatch(std::move(update));
    }
  }
  std::cout << "[poller] stopped" << std::endl;
}

void UpdatePoller::pause(std::stop_token& stop, std::chrono::seconds duration) {
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
  }
}

}
