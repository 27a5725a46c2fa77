#pragma once
#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "common/config/config.hpp"

namespace delivery_service {

struct HttpResponse {
  long status{0};
  std::string body;
  std::map<std::string, std::string> headers;  // lower-case names

  std::string header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
  }
};

struct HttpRequest {
  std::string url;
  std::string method{"GET"};
  std::vector<std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
  size_t max_body_bytes{0};  // 0 means unlimited
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

CurlHandle makeCurlHandle();

// Blocking HTTP client over libcurl with status-driven retries and
// exponential backoff. Safe to share between threads: every request uses its
// own easy handle.
class HttpClient {
public:
  explicit HttpClient(config::HttpClientConfig cfg);

  std::expected<HttpResponse, std::string> perform(const HttpRequest& request) const;

  bool shouldRetry(long status) const;
  std::chrono::milliseconds backoff(int attempt) const;

private:
  std::expected<HttpResponse, std::string> performOnce(const HttpRequest& request) const;

  static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
  static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

  config::HttpClientConfig cfg_;
};

}
