#include "telegram_client.hpp"
#include <fstream>
#include <iostream>

namespace delivery_service {

namespace {

struct UploadSource {
  std::ifstream file;
  int64_t sent{0};
  int64_t total{0};
  ChatClient::ChunkObserver* observer{nullptr};
  bool aborted{false};
};

int64_t int64Field(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) {
    return 0;
  }
  return it->get<int64_t>();
}

std::string stringField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

const nlohmann::json* objectField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_object()) {
    return nullptr;
  }
  return &*it;
}

IncomingMessage parseMessage(const nlohmann::json& m) {
  IncomingMessage message;
  message.message_id = int64Field(m, "message_id");
  if (const auto* chat = objectField(m, "chat")) {
    message.chat_id = int64Field(*chat, "id");
    message.chat_type = stringField(*chat, "type");
    message.chat_title = stringField(*chat, "title");
  }
  if (const auto* from = objectField(m, "from")) {
    message.user_id = int64Field(*from, "id");
    message.username = stringField(*from, "username");
  }
  message.text = stringField(m, "text");
  if (message.text.empty()) {
    message.text = stringField(m, "caption");
  }
  return message;
}

CallbackQuery parseCallbackQuery(const nlohmann::json& q) {
  CallbackQuery query;
  query.id = stringField(q, "id");
  query.data = stringField(q, "data");
  if (const auto* from = objectField(q, "from")) {
    query.user_id = int64Field(*from, "id");
  }
  if (const auto* message = objectField(q, "message")) {
    query.message_id = int64Field(*message, "message_id");
    if (const auto* chat = objectField(*message, "chat")) {
      query.chat_id = int64Field(*chat, "id");
    }
  }
  return query;
}

} // namespace

ParsedUpdate parseUpdate(const nlohmann::json& j) {
  ParsedUpdate update;
  if (!j.is_object()) {
    return update;
  }
  update.update_id = int64Field(j, "update_id");
  if (const auto* message = objectField(j, "message")) {
    update.payload = parseMessage(*message);
  } else if (const auto* query = objectField(j, "callback_query")) {
    update.payload = parseCallbackQuery(*query);
  }
  return update;
}

nlohmann::json keyboardJson(const InlineKeyboard& keyboard) {
  auto rows = nlohmann::json::array();
  for (const auto& row : keyboard) {
    auto buttons = nlohmann::json::array();
    for (const auto& button : row) {
      buttons.push_back({{"text", button.text}, {"callback_data", button.callback_data}});
    }
    rows.push_back(std::move(buttons));
  }
  return {{"inline_keyboard", std::move(rows)}};
}

std::expected<nlohmann::json, std::string> unwrapApiResponse(long http_status, const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return std::unexpected("Telegram API error: HTTP " + std::to_string(http_status));
  }
  auto ok = j.find("ok");
  if (ok == j.end() || !ok->is_boolean() || !ok->get<bool>()) {
    auto description = stringField(j, "description");
    return std::unexpected("Telegram API error: " + (description.empty() ? std::string("Unknown error") : description));
  }
  auto result = j.find("result");
  return result == j.end() ? nlohmann::json{} : *result;
}

TelegramClient::TelegramClient(TelegramClientOptions options, std::shared_ptr<HttpClient> http)
  : options_(std::move(options)), http_(std::move(http)) {}

std::string TelegramClient::methodUrl(const std::string& method) const {
  return options_.api_base_url + "/bot" + options_.token + "/" + method;
}

std::expected<nlohmann::json, std::string> TelegramClient::call(
  const std::string& method,
  const nlohmann::json& params,
  std::chrono::seconds timeout
) {
  HttpRequest request{
    .url = methodUrl(method),
    .method = "POST",
    .headers = {"Content-Type: application/json"},
    .body = params.dump(),
    .timeout = timeout
  };

  auto response = http_->perform(request);
  if (!response) {
    return std::unexpected(method + " failed: " + response.error());
  }
  return unwrapApiResponse(response->status, response->body);
}

std::expected<int64_t, std::string> TelegramClient::sendMessage(
  int64_t chat_id,
  const std::string& text,
  std::optional<int64_t> reply_to_message_id,
  const InlineKeyboard& keyboard
) {
  nlohmann::json params{{"chat_id", chat_id}, {"text", text}};
  if (reply_to_message_id) {
    params["reply_to_message_id"] = *reply_to_message_id;
    params["allow_sending_without_reply"] = true;
  }
  if (!keyboard.empty()) {
    params["reply_markup"] = keyboardJson(keyboard);
  }

  auto result = call("sendMessage", params, options_.api_timeout);
  if (!result) {
    return std::unexpected(result.error());
  }
  return int64Field(*result, "message_id");
}

std::expected<void, std::string> TelegramClient::editMessageText(
  int64_t chat_id,
  int64_t message_id,
  const std::string& text,
  const InlineKeyboard& keyboard
) {
  nlohmann::json params{{"chat_id", chat_id}, {"message_id", message_id}, {"text", text}};
  if (!keyboard.empty()) {
    params["reply_markup"] = keyboardJson(keyboard);
  }

  auto result = call("editMessageText", params, options_.api_timeout);
  if (!result) {
    return std::unexpected(result.error());
  }
  return {};
}

std::expected<void, std::string> TelegramClient::deleteMessage(int64_t chat_id, int64_t message_id) {
  auto result = call("deleteMessage", {{"chat_id", chat_id}, {"message_id", message_id}}, options_.api_timeout);
  if (!result) {
    return std::unexpected(result.error());
  }
  return {};
}

std::expected<void, std::string> TelegramClient::answerCallback(
  const std::string& callback_id,
  const std::string& text
) {
  nlohmann::json params{{"callback_query_id", callback_id}};
  if (!text.empty()) {
    params["text"] = text;
  }
  auto result = call("answerCallbackQuery", params, options_.api_timeout);
  if (!result) {
    return std::unexpected(result.error());
  }
  return {};
}

std::expected<std::vector<ParsedUpdate>, std::string> TelegramClient::getUpdates(
  int64_t offset,
  std::chrono::seconds timeout
) {
  nlohmann::json params{
    {"offset", offset},
    {"timeout", timeout.count()},
    {"allowed_updates", {"message", "callback_query"}}
  };

  auto result = call("getUpdates", params, timeout + options_.api_timeout);
  if (!result) {
    return std::unexpected(result.error());
  }
  if (!result->is_array()) {
    return std::unexpected("getUpdates returned no update list");
  }

  std::vector<ParsedUpdate> updates;
  updates.reserve(result->size());
  for (const auto& u : *result) {
    updates.push_back(parseUpdate(u));
  }
  return updates;
}

std::expected<void, std::string> TelegramClient::setWebhook(const std::string& url, const std::string& secret_token) {
  nlohmann::json params{{"url", url}, {"allowed_updates", {"message", "callback_query"}}};
  if (!secret_token.empty()) {
    params["secret_token"] = secret_token;
  }
  auto result = call("setWebhook", params, options_.api_timeout);
  if (!result) {
    return std::unexpected(result.error());
  }
  return {};
}

std::expected<void, std::string> TelegramClient::deleteWebhook() {
  auto result = call("deleteWebhook", nlohmann::json::object(), options_.api_timeout);
  if (!result) {
    return std::unexpected(result.error());
  }
  return {};
}

std::expected<UploadStatus, std::string> TelegramClient::uploadMedia(
  const UploadRequest& request,
  ChunkObserver observer
) {
  std::error_code ec;
  auto file_size = std::filesystem::file_size(request.file_path, ec);
  if (ec) {
    return std::unexpected("Failed to stat " + request.file_path.string() + ": " + ec.message());
  }

  UploadSource source;
  source.file.open(request.file_path, std::ios::binary);
  if (!source.file) {
    return std::unexpected("Failed to open " + request.file_path.string());
  }
  source.total = static_cast<int64_t>(file_size);
  source.observer = observer ? &observer : nullptr;

  auto curl = makeCurlHandle();
  std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(curl_mime_init(curl.get()), &curl_mime_free);
  if (!mime) {
    return std::unexpected("Failed to initialize multipart body");
  }

  auto addField = [&](const std::string& name, const std::string& value) {
    auto* part = curl_mime_addpart(mime.get());
    curl_mime_name(part, name.c_str());
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
  };

  addField("chat_id", std::to_string(request.chat_id));
  addField("reply_to_message_id", std::to_string(request.reply_to_message_id));
  addField("allow_sending_without_reply", "true");
  for (const auto& [name, value] : request.extra_fields) {
    addField(name, value);
  }

  auto* file_part = curl_mime_addpart(mime.get());
  curl_mime_name(file_part, request.file_field.c_str());
  curl_mime_filename(file_part, request.send_filename.c_str());
  curl_mime_data_cb(file_part, static_cast<curl_off_t>(file_size), readChunk, nullptr, nullptr, &source);

  std::string body;
  auto url = methodUrl(request.method);
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collectBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.upload_connect_timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.upload_timeout.count()));

  auto res = curl_easy_perform(curl.get());
  if (source.aborted) {
    std::cout << "[telegram] upload of " << request.file_path.filename().string() << " aborted" << std::endl;
    return UploadStatus::Aborted;
  }
  if (res != CURLE_OK) {
    return std::unexpected(std::string("Upload failed: ") + curl_easy_strerror(res));
  }

  long http_status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
  auto result = unwrapApiResponse(http_status, body);
  if (!result) {
    return std::unexpected(result.error());
  }
  return UploadStatus::Delivered;
}

size_t TelegramClient::readChunk(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* source = static_cast<UploadSource*>(userdata);
  if (source->observer && !(*source->observer)(source->sent, source->total)) {
    source->aborted = true;
    return CURL_READFUNC_ABORT;
  }

  source->file.read(buffer, static_cast<std::streamsize>(size * nitems));
  auto n = source->file.gcount();
  if (n <= 0 && source->file.bad()) {
    return CURL_READFUNC_ABORT;
  }
  source->sent += n;
  return static_cast<size_t>(n);
}

size_t TelegramClient::collectBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

}
