#pragma once
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace delivery_service {

struct InlineButton {
  std::string text;
  std::string callback_data;
};

// Rows of buttons. Empty means no keyboard.
using InlineKeyboard = std::vector<std::vector<InlineButton>>;

struct UploadRequest {
  int64_t chat_id{0};
  int64_t reply_to_message_id{0};
  std::string method;       // "sendVideo", "sendDocument", "sendAudio"
  std::string file_field;   // "video", "document", "audio"
  std::filesystem::path file_path;
  std::string send_filename;
  std::vector<std::pair<std::string, std::string>> extra_fields;
};

enum class UploadStatus { Delivered, Aborted };

class ChatClient {
public:
  // Called before each chunk leaves; returning false aborts the upload.
  using ChunkObserver = std::function<bool(int64_t sent, int64_t total)>;
  virtual ~ChatClient() = default;

  virtual std::expected<int64_t, std::string> sendMessage(
    int64_t chat_id,
    const std::string& text,
    std::optional<int64_t> reply_to_message_id = std::nullopt,
    const InlineKeyboard& keyboard = {}
  ) = 0;

  virtual std::expected<void, std::string> editMessageText(
    int64_t chat_id,
    int64_t message_id,
    const std::string& text,
    const InlineKeyboard& keyboard = {}
  ) = 0;

  virtual std::expected<void, std::string> deleteMessage(int64_t chat_id, int64_t message_id) = 0;

  virtual std::expected<void, std::string> answerCallback(
    const std::string& callback_id,
    const std::string& text
  ) = 0;

  virtual std::expected<UploadStatus, std::string> uploadMedia(
    const UploadRequest& request,
    ChunkObserver observer
  ) = 0;
};

} // namespace delivery_service
