#include "bot_service.hpp"
#include "application/text_format.hpp"
#include <iostream>

namespace delivery_service {

namespace {

std::string commandName(const std::string& text) {
  auto end = text.find_first_of(" \t\n@");
  return end == std::string::npos ? text : text.substr(0, end);
}

std::string trimmed(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

} // namespace

BotService::BotService(std::shared_ptr<MediaResolver> resolver,
                       std::shared_ptr<SizePlanner> planner,
                       std::shared_ptr<AudioFitter> fitter,
                       StatusReporter& reporter,
                       StatusChannel& status,
                       PendingChoiceStore& pending,
                       CancellationRegistry& cancellations,
                       JobQueue& queue,
                       BotServiceOptions options)
  : resolver_(std::move(resolver)),
    planner_(std::move(planner)),
    fitter_(std::move(fitter)),
    reporter_(reporter),
    status_(status),
    pending_(pending),
    cancellations_(cancellations),
    queue_(queue),
    options_(std::move(options)) {}

std::string BotService::helpText() const {
  return "Send me a video link and I'll download it for you.\n\n"
         "You can choose:\n"
         "- Video\n"
         "- Document (original file)\n"
         "- Audio (MP3)\n\n"
         "Upload limit: " + formatBytes(options_.max_send_bytes);
}

void BotService::handleMessage(const IncomingMessage& message) {
  if (message.chat_type != "private") {
    return;
  }

  auto text = trimmed(message.text);
  if (text.empty()) {
    return;
  }

  if (text.front() == '/') {
    auto cmd = commandName(text);
    if (cmd == "/start" || cmd == "/help") {
      reporter_.send(message.chat_id, helpText(), message.message_id);
    }
    return;
  }

  auto url = extractFirstUrl(text);
  if (!url) {
    return;
  }

  if (urlScheme(*url).empty()) {
    reporter_.send(message.chat_id, "Invalid URL", message.message_id);
    return;
  }

  if (isYoutubeHost(urlHost(*url)) && !isValidYoutubeUrl(*url)) {
    reporter_.send(message.chat_id, "Invalid URL", message.message_id);
    return;
  }

  logRequest(message, *url);
  offerChoices(message, *url);
}

void BotService::logRequest(const IncomingMessage& message, const std::string& url) {
  std::cout << "[bot] request from " << message.user_id << " in " << message.chat_id << ": " << url << std::endl;
  if (!options_.log_chat_id) {
    return;
  }

  std::string chat_info = message.chat_type == "private"
    ? "Private chat"
    : "Group: " + message.chat_title + " (" + std::to_string(message.chat_id) + ")";
  reporter_.send(*options_.log_chat_id,
                 "Download request (video) from @" + message.username + " (" + std::to_string(message.user_id) + ")\n\n" +
                 chat_info + "\n\n" + url);
}

void BotService::offerChoices(const IncomingMessage& message, const std::string& url) {
  auto swept = pending_.sweep();
  if (swept > 0) {
    std::cout << "[bot] dropped " << swept << " expired pending requests" << std::endl;
  }

  auto processing = reporter_.send(message.chat_id, "Getting info...", message.message_id);

  auto info = resolver_->inspect(url);
  if (!info) {
    std::cerr << "[bot] metadata lookup failed for " << url << ": " << info.error() << std::endl;
    if (processing) {
      reporter_.remove(message.chat_id, *processing);
    }
    reporter_.send(message.chat_id, "Invalid URL or unsupported website.", message.message_id);
    return;
  }

  auto title = stripHashtags(trimmed(info->title.empty() ? "Video" : info->title));
  if (title.empty()) {
    title = "Video";
  }

  auto video_plan = planner_->plan(*info);
  auto audio = fitter_->fit(durationSeconds(*info));
  auto decision = decide(video_plan, audio, options_.max_send_bytes);

  if (processing) {
    reporter_.remove(message.chat_id, *processing);
  }

  const auto limit = formatBytes(options_.max_send_bytes);
  std::string text;
  InlineKeyboard keyboard;

  switch (decision.verdict) {
    case DeliveryDecision::Verdict::Offer: {
      auto request_id = storeChoice(message, url, title, decision);
      keyboard.push_back({
        InlineButton{"Download as Video", modeSelectionToken(DeliveryMode::Video, request_id)},
        InlineButton{"Download as Document", modeSelectionToken(DeliveryMode::Document, request_id)},
      });
      text = title + "\n\nChoose download method:\n" +
             "Estimated size: " + formatBytes(decision.video_size) + " (limit " + limit + ")\n" +
             "Selected: " + qualityLabel(*decision.video_plan);
      if (decision.audio_plan) {
        keyboard.push_back({InlineButton{"Download as Audio (MP3)", modeSelectionToken(DeliveryMode::Audio, request_id)}});
        text += "\nAudio: " + decision.audio_plan->quality_label;
      }
      break;
    }
    case DeliveryDecision::Verdict::VideoTooLarge:
    case DeliveryDecision::Verdict::VideoUnconfirmed: {
      if (decision.verdict == DeliveryDecision::Verdict::VideoTooLarge) {
        text = title + "\n\nThis video is too large for Telegram bots.\n" +
               "Estimated size: " + formatBytes(decision.video_size) + "\n" +
               "Limit: " + limit + "\n";
      } else {
        text = title + "\n\nI can't reliably determine the final video size before downloading.\n" +
               "Telegram bot upload limit is " + limit + ".\n" +
               "Please try a shorter video.\n";
      }

      if (decision.audio_plan) {
        auto request_id = storeChoice(message, url, title, decision);
        keyboard.push_back({InlineButton{"Download as Audio (MP3)", modeSelectionToken(DeliveryMode::Audio, request_id)}});
        text += "\nAudio option available: " + decision.audio_plan->quality_label;
      } else if (decision.audio_reason) {
        text += "\nAudio is not available: " + *decision.audio_reason;
      }
      break;
    }
  }

  reporter_.send(message.chat_id, text, message.message_id, keyboard);
}

std::string BotService::storeChoice(const IncomingMessage& message, const std::string& url,
                                    const std::string& title, const DeliveryDecision& decision) {
  return pending_.put(PendingChoice{
    .created_at = PendingChoiceStore::Clock::now(),
    .user_id = message.user_id,
    .chat = ChatContext{message.chat_id, message.message_id},
    .url = url,
    .title = title,
    .video_plan = decision.video_plan,
    .audio_plan = decision.audio_plan
  });
}

void BotService::handleCallback(const CallbackQuery& query) {
  try {
    auto token = parseCallbackToken(query.data);
    std::visit(overloaded{
      [&](const ModeSelection& s) { onModeSelection(query, s); },
      [&](const CancelRequest& c) { onCancel(query, c); },
      [&](const MalformedToken&) { reporter_.answer(query.id, "Invalid action"); },
    }, token);
  } catch (const std::exception& e) {
    std::cerr << "[bot] callback " << query.data << " failed: " << e.what() << std::endl;
    reporter_.answer(query.id, "Error");
  }
}

void BotService::onModeSelection(const CallbackQuery& query, const ModeSelection& selection) {
  auto mode = modeFromTag(selection.mode_tag);
  if (!mode || !query.chat_id || !query.message_id) {
    reporter_.answer(query.id, "Invalid action");
    return;
  }

  auto choice = pending_.take(selection.request_id, query.user_id);
  if (!choice) {
    switch (choice.error()) {
      case TakeError::Expired:
        reporter_.answer(query.id, "Request expired. Send the link again.");
        break;
      case TakeError::NotOwner:
        reporter_.answer(query.id, "This is not your request.");
        break;
    }
    return;
  }

  std::optional<DeliveryPlan> plan;
  if (*mode == DeliveryMode::Audio) {
    if (!choice->audio_plan) {
      reporter_.answer(query.id, "Audio is not available.");
      return;
    }
    plan = *choice->audio_plan;
  } else {
    if (!choice->video_plan) {
      reporter_.answer(query.id, "Video is not available.");
      return;
    }
    plan = *choice->video_plan;
  }

  reporter_.answer(query.id, "OK");

  DeliveryJob job{
    .job_id = generateShortId(),
    .chat = choice->chat,
    .status_message_id = *query.message_id,
    .user_id = choice->user_id,
    .url = choice->url,
    .title = choice->title,
    .mode = *mode,
    .plan = std::move(*plan)
  };

  cancellations_.add(job.job_id, job.user_id, job.chat.chat_id, job.status_message_id);

  // published before the push so that it precedes every edit of the worker
  status_.publish(StatusUpdate{
    .kind = StatusUpdate::Kind::Edit,
    .chat_id = job.chat.chat_id,
    .message_id = job.status_message_id,
    .text = status_text::queued(job.title, queue_.size() + 1),
    .keyboard = cancelKeyboard(job.job_id),
    .force = true
  });

  std::cout << "[bot] job " << job.job_id << " queued (" << modeTag(job.mode) << ", "
            << qualityLabel(job.plan) << ")" << std::endl;
  queue_.push(std::move(job));
}

void BotService::onCancel(const CallbackQuery& query, const CancelRequest& request) {
  auto result = cancellations_.requestCancel(request.job_id, query.user_id);
  switch (result.outcome) {
    case CancelOutcome::NotFound:
      reporter_.answer(query.id, "Nothing to cancel.");
      return;
    case CancelOutcome::NotOwner:
      reporter_.answer(query.id, "This is not your request.");
      return;
    case CancelOutcome::Requested:
      break;
  }

  std::cout << "[bot] cancel requested for job " << request.job_id << std::endl;
  status_.publish(StatusUpdate{
    .kind = StatusUpdate::Kind::Remove,
    .chat_id = result.entry->chat_id,
    .message_id = result.entry->status_message_id
  });
  reporter_.answer(query.id, "Cancelled.");
}

}
