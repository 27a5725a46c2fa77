#include "range_prober.hpp"
#include <charconv>
#include <iostream>

namespace delivery_service {

namespace {

std::optional<int64_t> parsePositive(const std::string& s) {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return std::nullopt;
  }
  auto end = s.find_last_not_of(" \t");
  int64_t value = 0;
  auto first = s.data() + begin;
  auto last = s.data() + end + 1;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || value <= 0) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<int64_t> parseProbedTotal(const std::string& content_range,
                                        const std::string& content_length) {
  auto slash = content_range.rfind('/');
  if (slash != std::string::npos) {
    if (auto total = parsePositive(content_range.substr(slash + 1))) {
      return total;
    }
  }

  if (auto length = parsePositive(content_length); length && *length > kMinTrustedContentLength) {
    return length;
  }
  return std::nullopt;
}

RangeProber::RangeProber(std::shared_ptr<HttpClient> http, std::chrono::seconds timeout)
  : http_(std::move(http)), timeout_(timeout) {}

std::expected<int64_t, std::string> RangeProber::probeTotalSize(const std::string& url) {
  HttpRequest request{
    .url = url,
    .method = "GET",
    .headers = {"Range: bytes=0-0", "User-Agent: Mozilla/5.0"},
    .timeout = timeout_,
    .max_body_bytes = 4096
  };

  auto response = http_->perform(request);
  if (!response) {
    std::cerr << "[probe] " << response.error() << std::endl;
    return std::unexpected(response.error());
  }
  if (response->status >= 400) {
    return std::unexpected("HTTP error: " + std::to_string(response->status));
  }

  auto total = parseProbedTotal(response->header("content-range"), response->header("content-length"));
  if (!total) {
    return std::unexpected("No usable size in response headers");
  }
  return *total;
}

}
