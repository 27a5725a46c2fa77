#pragma once
#include <string>
#include "common/restful/rest_api_handler_base.hpp"
#include "interface/update_dispatcher.hpp"

namespace delivery_service {

inline constexpr const char* kWebhookPath = "/telegram/webhook";
inline constexpr const char* kSecretTokenHeader = "X-Telegram-Bot-Api-Secret-Token";

// Receives updates pushed by the platform. Requests must be a POST to the
// configured path and, when a secret is set, carry it in kSecretTokenHeader.
class WebhookHandler : public common::RestApiHandlerBase {
public:
  WebhookHandler(std::string path, std::string secret_token, UpdateSink& sink);

protected:
  common::StringResponse doHandleRequest(common::StringRequest&& req) override;

private:
  std::string path_;
  std::string secret_token_;
  UpdateSink& sink_;
};

}
