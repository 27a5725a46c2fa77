#pragma once
#include <expected>
#include <memory>
#include <string>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace common {

using StringRequest = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;

class RestApiHandlerBase {
public:
  virtual ~RestApiHandlerBase() = default;

  // Never throws: handler failures become a 500 with a JSON error body.
  StringResponse handleRequest(StringRequest&& req) {
    auto version = req.version();
    auto keep_alive = req.keep_alive();
    try {
      auto response = doHandleRequest(std::move(req));
      response.keep_alive(keep_alive);
      return response;
    } catch (const std::exception& e) {
      auto response = createErrorResponse(http::status::internal_server_error,
                                          "Internal server error: " + std::string(e.what()), version);
      response.keep_alive(keep_alive);
      return response;
    }
  }

protected:
  virtual StringResponse doHandleRequest(StringRequest&& req) = 0;

  StringResponse createJsonResponse(http::status status, const nlohmann::json& json, unsigned version = 11);
  StringResponse createErrorResponse(http::status status, const std::string& message, unsigned version = 11);

  std::expected<nlohmann::json, std::string> parseRequestBody(const std::string& body);
};

}
