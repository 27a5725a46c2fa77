#pragma once
#include <atomic>
#include <functional>
#include <variant>
#include "application/bot_service.hpp"
#include "common/thread_pool.hpp"
#include "infrastructure/telegram_client.hpp"

namespace delivery_service {

class UpdateSink {
public:
  virtual ~UpdateSink() = default;
  virtual void dispatch(ParsedUpdate update) = 0;
};

// Hands each update to the bot service on the handler pool so that a slow
// metadata lookup never stalls the inbound loop.
class UpdateDispatcher : public UpdateSink {
public:
  UpdateDispatcher(BotService& bot, common::ThreadPool& pool);

  void dispatch(ParsedUpdate update) override;

  size_t ignored() const { return ignored_.load(std::memory_order_relaxed); }

private:
  void submit(std::function<void()> work, int64_t update_id);

  BotService& bot_;
  common::ThreadPool& pool_;
  std::atomic<size_t> ignored_{0};
};

}
