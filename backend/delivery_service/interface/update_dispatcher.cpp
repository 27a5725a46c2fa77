#include "update_dispatcher.hpp"
#include <iostream>

namespace delivery_service {

UpdateDispatcher::UpdateDispatcher(BotService& bot, common::ThreadPool& pool)
  : bot_(bot), pool_(pool) {}

void UpdateDispatcher::dispatch(ParsedUpdate update) {
  std::visit(overloaded{
    [&](IncomingMessage& message) {
      submit([this, message = std::move(message)]() { bot_.handleMessage(message); }, update.update_id);
    },
    [&](CallbackQuery& query) {
      submit([this, query = std::move(query)]() { bot_.handleCallback(query); }, update.update_id);
    },
    [&](std::monostate&) {
      ignored_.fetch_add(1, std::memory_order_relaxed);
    },
  }, update.payload);
}

void UpdateDispatcher::submit(std::function<void()> work, int64_t update_id) {
  try {
    pool_.commit([work = std::move(work), update_id]() {
      try {
        work();
      } catch (const std::exception& e) {
        std::cerr << "[dispatch] update " << update_id << " failed: " << e.what() << std::endl;
      }
    });
  } catch (const std::exception& e) {
    std::cerr << "[dispatch] update " << update_id << " dropped: " << e.what() << std::endl;
  }
}

}
