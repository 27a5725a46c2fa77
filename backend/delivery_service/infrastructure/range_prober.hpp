#pragma once
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include "domain/media_resolver.hpp"
#include "infrastructure/http_client.hpp"

namespace delivery_service {

// Smallest Content-Length accepted as a whole-file size when the server
// ignores the range request.
inline constexpr int64_t kMinTrustedContentLength = 1024 * 1024;

// Total size from the headers of a "Range: bytes=0-0" response. Prefers the
// "/N" tail of Content-Range; falls back to a Content-Length above
// kMinTrustedContentLength.
std::optional<int64_t> parseProbedTotal(const std::string& content_range,
                                        const std::string& content_length);

class RangeProber : public SizeProber {
public:
  RangeProber(std::shared_ptr<HttpClient> http, std::chrono::seconds timeout);

  std::expected<int64_t, std::string> probeTotalSize(const std::string& url) override;

private:
  std::shared_ptr<HttpClient> http_;
  std::chrono::seconds timeout_;
};

}
