#include "callback_token.hpp"
#include <vector>

namespace delivery_service {

namespace {

std::vector<std::string> splitBar(const std::string& data) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    auto pos = data.find('|', start);
    if (pos == std::string::npos) {
      parts.push_back(data.substr(start));
      break;
    }
    parts.push_back(data.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

} // namespace

CallbackToken parseCallbackToken(const std::string& data) {
  auto parts = splitBar(data);
  if (parts[0] == "dl" && parts.size() == 3 && !parts[2].empty()) {
    return ModeSelection{parts[1], parts[2]};
  }
  if (parts[0] == "cnl" && parts.size() == 2 && !parts[1].empty()) {
    return CancelRequest{parts[1]};
  }
  return MalformedToken{};
}

std::string modeSelectionToken(DeliveryMode mode, const std::string& request_id) {
  return "dl|" + modeTag(mode) + "|" + request_id;
}

std::string cancelToken(const std::string& job_id) {
  return "cnl|" + job_id;
}

InlineKeyboard cancelKeyboard(const std::string& job_id) {
  return {{InlineButton{"Cancel", cancelToken(job_id)}}};
}

}
