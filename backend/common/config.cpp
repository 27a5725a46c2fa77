#include "common/config/config.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace config {

  Config::Config() {
    reset();
  }

  void Config::reset() {
    bot_ = {
      .token = "",
      .api_base_url = "https://api.telegram.org",
      .log_chat_id = std::nullopt
    };

    delivery_ = {
      .max_send_bytes = 50'000'000,
      .audio_headroom_bytes = 1'500'000,
      .audio_bitrate_ladder = {192, 160, 128, 112, 96, 80, 64, 48, 32},
      .output_folder = "./downloads",
      .edit_interval = std::chrono::milliseconds(1800),
      .pending_ttl = std::chrono::seconds(10 * 60)
    };

    workers_ = {
      .workers = 2,
      .handler_threads = 4
    };

    resolver_ = {
      .binary = "yt-dlp",
      .concurrent_fragments = 4,
      .retries = 5,
      .fragment_retries = 5,
      .socket_timeout_sec = 20
    };

    http_client_ = {
      .max_retries = 4,
      .backoff_factor = 0.6,
      .retry_statuses = {429, 500, 502, 503, 504},
      .probe_timeout = std::chrono::seconds(10),
      .api_timeout = std::chrono::seconds(30),
      .poll_timeout = std::chrono::seconds(25),
      .upload_connect_timeout = std::chrono::seconds(20),
      .upload_timeout = std::chrono::seconds(60 * 30)
    };

    webhook_ = {
      .mode = InboundMode::Polling,
      .host = "0.0.0.0",
      .port = 8443,
      .public_url = "",
      .secret_token = ""
    };
  }

  void Config::load() {
    if (const char* path = std::getenv("DELIVERY_BOT_CONFIG"); path && *path) {
      loadFile(path);
    }
    loadEnvironment();

    if (bot_.token.empty()) {
      throw std::runtime_error("Bot token is not configured (set BOT_TOKEN)");
    }
    if (workers_.workers < 1) {
      workers_.workers = 1;
    }
  }

  void Config::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
      j = nlohmann::json::parse(in);
    } catch (const std::exception& e) {
      throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }

    if (j.contains("bot")) {
      const auto& b = j["bot"];
      bot_.token = b.value("token", bot_.token);
      bot_.api_base_url = b.value("api_base_url", bot_.api_base_url);
      if (b.contains("log_chat_id") && b["log_chat_id"].is_number_integer()) {
        bot_.log_chat_id = b["log_chat_id"].get<int64_t>();
      }
    }

    if (j.contains("delivery")) {
      const auto& d = j["delivery"];
      delivery_.max_send_bytes = d.value("max_filesize", delivery_.max_send_bytes);
      delivery_.audio_headroom_bytes = d.value("audio_headroom_bytes", delivery_.audio_headroom_bytes);
      delivery_.output_folder = d.value("output_folder", delivery_.output_folder);
      if (d.contains("edit_interval_ms")) {
        delivery_.edit_interval = std::chrono::milliseconds(d["edit_interval_ms"].get<int64_t>());
      }
      if (d.contains("pending_ttl_sec")) {
        delivery_.pending_ttl = std::chrono::seconds(d["pending_ttl_sec"].get<int64_t>());
      }
    }

    if (j.contains("workers")) {
      const auto& w = j["workers"];
      workers_.workers = w.value("workers", workers_.workers);
      workers_.handler_threads = w.value("handler_threads", workers_.handler_threads);
    }

    if (j.contains("resolver")) {
      const auto& r = j["resolver"];
      resolver_.binary = r.value("binary", resolver_.binary);
      resolver_.concurrent_fragments = r.value("concurrent_fragments", resolver_.concurrent_fragments);
      resolver_.retries = r.value("retries", resolver_.retries);
      resolver_.fragment_retries = r.value("fragment_retries", resolver_.fragment_retries);
      resolver_.socket_timeout_sec = r.value("socket_timeout_sec", resolver_.socket_timeout_sec);
    }

    if (j.contains("webhook")) {
      const auto& w = j["webhook"];
      if (w.value("enabled", false)) {
        webhook_.mode = InboundMode::Webhook;
      }
      webhook_.host = w.value("host", webhook_.host);
      webhook_.port = w.value("port", webhook_.port);
      webhook_.public_url = w.value("public_url", webhook_.public_url);
      webhook_.secret_token = w.value("secret_token", webhook_.secret_token);
    }
  }

  void Config::loadEnvironment() {
    if (const char* v = std::getenv("BOT_TOKEN"); v && *v) {
      bot_.token = v;
    }
    if (const char* v = std::getenv("BOT_OUTPUT_DIR"); v && *v) {
      delivery_.output_folder = v;
    }
    if (const char* v = std::getenv("BOT_LOG_CHAT_ID"); v && *v) {
      bot_.log_chat_id = std::stoll(v);
    }
    if (const char* v = std::getenv("BOT_MAX_FILESIZE"); v && *v) {
      delivery_.max_send_bytes = std::stoll(v);
    }
    if (const char* v = std::getenv("BOT_WORKERS"); v && *v) {
      workers_.workers = static_cast<size_t>(std::stoul(v));
    }
  }
}
