#include "rest_api_handler_base.hpp"

namespace common {

StringResponse RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json, unsigned version) {

  StringResponse res{status, version};
  res.set(http::field::content_type, "application/json");
  res.body() = json.dump();
  res.prepare_payload();
  return res;
}

StringResponse RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message, unsigned version) {

  nlohmann::json error_json = {
    {"ok", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json, version);
}

std::expected<nlohmann::json, std::string> RestApiHandlerBase::parseRequestBody(const std::string& body) {
  if (body.empty()) {
    return std::unexpected("Empty request body");
  }
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded()) {
    return std::unexpected("Invalid JSON in request body");
  }
  return json;
}

}
