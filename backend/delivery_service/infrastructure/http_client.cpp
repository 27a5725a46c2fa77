#include "http_client.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace delivery_service {

namespace {

struct BodySink {
  std::string* body;
  size_t limit;
  bool truncated{false};
};

std::string lowered(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string stripped(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

} // namespace

CurlHandle makeCurlHandle() {
  CurlHandle handle(curl_easy_init(), &curl_easy_cleanup);
  if (!handle) {
    throw std::runtime_error("Failed to initialize CURL");
  }
  return handle;
}

HttpClient::HttpClient(config::HttpClientConfig cfg) : cfg_(std::move(cfg)) {}

bool HttpClient::shouldRetry(long status) const {
  return std::find(cfg_.retry_statuses.begin(), cfg_.retry_statuses.end(), status) != cfg_.retry_statuses.end();
}

std::chrono::milliseconds HttpClient::backoff(int attempt) const {
  if (attempt < 1) {
    return std::chrono::milliseconds{0};
  }
  double seconds = cfg_.backoff_factor * std::pow(2.0, attempt - 1);
  return std::chrono::milliseconds{std::llround(seconds * 1000.0)};
}

std::expected<HttpResponse, std::string> HttpClient::perform(const HttpRequest& request) const {
  std::expected<HttpResponse, std::string> result = std::unexpected(std::string{"request not attempted"});

  for (int attempt = 0; attempt <= cfg_.max_retries; ++attempt) {
    if (attempt > 0) {
      std::this_thread::sleep_for(backoff(attempt));
    }

    result = performOnce(request);
    if (result && !shouldRetry(result->status)) {
      return result;
    }

    if (attempt < cfg_.max_retries) {
      std::cerr << "[http] " << request.method << " attempt " << attempt + 1 << " failed: "
                << (result ? "HTTP " + std::to_string(result->status) : result.error()) << std::endl;
    }
  }
  return result;
}

std::expected<HttpResponse, std::string> HttpClient::performOnce(const HttpRequest& request) const {
  auto curl = makeCurlHandle();
  HttpResponse response;
  BodySink sink{&response.body, request.max_body_bytes};

  curl_slist* list = nullptr;
  for (const auto& h : request.headers) {
    list = curl_slist_append(list, h.c_str());
  }
  CurlHeaders headers(list, &curl_slist_free_all);

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  if (request.method == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  } else if (request.method != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
  }

  auto res = curl_easy_perform(curl.get());
  // a body cut short on purpose still carries valid status and headers
  if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && sink.truncated)) {
    return std::unexpected(curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

size_t HttpClient::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* sink = static_cast<BodySink*>(userdata);
  size_t total = size * nmemb;
  if (sink->limit > 0 && sink->body->size() + total > sink->limit) {
    sink->body->append(ptr, sink->limit - sink->body->size());
    sink->truncated = true;
    return 0;
  }
  sink->body->append(ptr, total);
  return total;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  size_t total = size * nitems;
  std::string line(buffer, total);

  // a new status line starts a new header block after redirects
  if (line.rfind("HTTP/", 0) == 0) {
    headers->clear();
    return total;
  }

  auto colon = line.find(':');
  if (colon != std::string::npos) {
    (*headers)[lowered(stripped(line.substr(0, colon)))] = stripped(line.substr(colon + 1));
  }
  return total;
}

}
