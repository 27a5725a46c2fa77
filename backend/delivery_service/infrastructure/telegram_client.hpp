#pragma once
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/chat_client.hpp"
#include "domain/update.hpp"
#include "infrastructure/http_client.hpp"

namespace delivery_service {

struct TelegramClientOptions {
  std::string api_base_url;  // "https://api.telegram.org"
  std::string token;
  std::chrono::seconds api_timeout{30};
  std::chrono::seconds upload_connect_timeout{20};
  std::chrono::seconds upload_timeout{1800};
};

// One entry of getUpdates or one webhook body. Payloads the bot does not act
// on are left as monostate but still carry their update id.
struct ParsedUpdate {
  int64_t update_id{0};
  std::variant<std::monostate, IncomingMessage, CallbackQuery> payload;
};

ParsedUpdate parseUpdate(const nlohmann::json& j);
nlohmann::json keyboardJson(const InlineKeyboard& keyboard);

// Unwraps a Bot API envelope: the "result" member when "ok" is true,
// otherwise "Telegram API error: <description>".
std::expected<nlohmann::json, std::string> unwrapApiResponse(long http_status, const std::string& body);

class TelegramClient : public ChatClient {
public:
  TelegramClient(TelegramClientOptions options, std::shared_ptr<HttpClient> http);

  std::expected<int64_t, std::string> sendMessage(
    int64_t chat_id,
    const std::string& text,
    std::optional<int64_t> reply_to_message_id = std::nullopt,
    const InlineKeyboard& keyboard = {}
  ) override;

  std::expected<void, std::string> editMessageText(
    int64_t chat_id,
    int64_t message_id,
    const std::string& text,
    const InlineKeyboard& keyboard = {}
  ) override;

  std::expected<void, std::string> deleteMessage(int64_t chat_id, int64_t message_id) override;

  std::expected<void, std::string> answerCallback(
    const std::string& callback_id,
    const std::string& text
  ) override;

  std::expected<UploadStatus, std::string> uploadMedia(
    const UploadRequest& request,
    ChunkObserver observer
  ) override;

  std::expected<std::vector<ParsedUpdate>, std::string> getUpdates(int64_t offset, std::chrono::seconds timeout);
  std::expected<void, std::string> setWebhook(const std::string& url, const std::string& secret_token);
  std::expected<void, std::string> deleteWebhook();

private:
  std::string methodUrl(const std::string& method) const;
  std::expected<nlohmann::json, std::string> call(
    const std::string& method,
    const nlohmann::json& params,
    std::chrono::seconds timeout
  );

  static size_t readChunk(char* buffer, size_t size, size_t nitems, void* userdata);
  static size_t collectBody(char* ptr, size_t size, size_t nmemb, void* userdata);

  TelegramClientOptions options_;
  std::shared_ptr<HttpClient> http_;
};

}
