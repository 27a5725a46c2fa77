#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "application/audio_fitter.hpp"
#include "application/callback_token.hpp"
#include "application/cancellation_registry.hpp"
#include "application/decision_gate.hpp"
#include "application/job_queue.hpp"
#include "application/pending_choice_store.hpp"
#include "application/size_planner.hpp"
#include "application/status_channel.hpp"
#include "application/status_reporter.hpp"
#include "domain/media_resolver.hpp"
#include "domain/update.hpp"

namespace delivery_service {

struct BotServiceOptions {
  int64_t max_send_bytes{0};
  std::optional<int64_t> log_chat_id;
};

// Inbound side of the bot: turns a URL into an offer, a button press into a
// queued job, and a cancel press into a raised flag. Nothing is enqueued for
// video or document unless the decision gate proved the size fits.
class BotService {
public:
  BotService(std::shared_ptr<MediaResolver> resolver,
             std::shared_ptr<SizePlanner> planner,
             std::shared_ptr<AudioFitter> fitter,
             StatusReporter& reporter,
             StatusChannel& status,
             PendingChoiceStore& pending,
             CancellationRegistry& cancellations,
             JobQueue& queue,
             BotServiceOptions options);

  void handleMessage(const IncomingMessage& message);
  void handleCallback(const CallbackQuery& query);

  std::string helpText() const;

private:
  void offerChoices(const IncomingMessage& message, const std::string& url);
  void logRequest(const IncomingMessage& message, const std::string& url);

  void onModeSelection(const CallbackQuery& query, const ModeSelection& selection);
  void onCancel(const CallbackQuery& query, const CancelRequest& request);

  std::string storeChoice(const IncomingMessage& message, const std::string& url,
                          const std::string& title, const DeliveryDecision& decision);

  std::shared_ptr<MediaResolver> resolver_;
  std::shared_ptr<SizePlanner> planner_;
  std::shared_ptr<AudioFitter> fitter_;
  StatusReporter& reporter_;
  StatusChannel& status_;
  PendingChoiceStore& pending_;
  CancellationRegistry& cancellations_;
  JobQueue& queue_;
  BotServiceOptions options_;
};

}
