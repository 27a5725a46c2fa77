#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <chrono>
#include <optional>
#include <vector>

namespace config {

struct BotConfig {
  std::string token;
  std::string api_base_url;
  std::optional<int64_t> log_chat_id;
};

struct DeliveryConfig {
  int64_t max_send_bytes;
  int64_t audio_headroom_bytes;
  std::vector<int> audio_bitrate_ladder;  // kbps, highest first
  std::string output_folder;
  std::chrono::milliseconds edit_interval;
  std::chrono::seconds pending_ttl;
};

struct WorkerConfig {
  size_t workers;
  size_t handler_threads;
};

struct ResolverConfig {
  std::string binary;
  int concurrent_fragments;
  int retries;
  int fragment_retries;
  int socket_timeout_sec;
};

struct HttpClientConfig {
  int max_retries;
  double backoff_factor;
  std::vector<long> retry_statuses;
  std::chrono::seconds probe_timeout;
  std::chrono::seconds api_timeout;
  std::chrono::seconds poll_timeout;
  std::chrono::seconds upload_connect_timeout;
  std::chrono::seconds upload_timeout;
};

enum class InboundMode { Polling, Webhook };

struct WebhookConfig {
  InboundMode mode;
  std::string host;
  unsigned short port;
  std::string public_url;
  std::string secret_token;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Overlays the JSON file named by DELIVERY_BOT_CONFIG and then the BOT_*
// environment variables on top of the compiled-in defaults.
void load();

// Restores the compiled-in defaults.
void reset();

// Getters
const BotConfig& getBot() const { return bot_; }
const DeliveryConfig& getDelivery() const { return delivery_; }
const WorkerConfig& getWorkers() const { return workers_; }
const ResolverConfig& getResolver() const { return resolver_; }
const HttpClientConfig& getHttpClient() const { return http_client_; }
const WebhookConfig& getWebhook() const { return webhook_; }

private:
  Config();

  void loadFile(const std::string& path);
  void loadEnvironment();

  BotConfig bot_;
  DeliveryConfig delivery_;
  WorkerConfig workers_;
  ResolverConfig resolver_;
  HttpClientConfig http_client_;
  WebhookConfig webhook_;
};

} // namespace config
