#include "webhook_handler.hpp"
#include <iostream>

namespace delivery_service {

WebhookHandler::WebhookHandler(std::string path, std::string secret_token, UpdateSink& sink)
  : path_(std::move(path)), secret_token_(std::move(secret_token)), sink_(sink) {}

common::StringResponse WebhookHandler::doHandleRequest(common::StringRequest&& req) {
  if (std::string(req.target()) != path_) {
    return createErrorResponse(http::status::not_found, "Not found", req.version());
  }
  if (req.method() != http::verb::post) {
    return createErrorResponse(http::status::method_not_allowed, "Method not allowed", req.version());
  }
  if (!secret_token_.empty() && std::string(req[kSecretTokenHeader]) != secret_token_) {
    std::cerr << "[webhook] rejected request with a bad secret token" << std::endl;
    return createErrorResponse(http::status::forbidden, "Forbidden", req.version());
  }

  auto body = parseRequestBody(req.body());
  if (!body) {
    return createErrorResponse(http::status::bad_request, body.error(), req.version());
  }

  sink_.dispatch(parseUpdate(*body));
  return createJsonResponse(http::status::ok, {{"ok", true}}, req.version());
}

}
