#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include "common/config/config.hpp"
#include "fakes.hpp"

using delivery_service::fakes::TempDir;

namespace {

const char* kVariables[] = {
  "DELIVERY_BOT_CONFIG", "BOT_TOKEN", "BOT_OUTPUT_DIR", "BOT_LOG_CHAT_ID", "BOT_MAX_FILESIZE", "BOT_WORKERS"
};

}

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    clearEnvironment();
    cfg().reset();
  }

  void TearDown() override {
    clearEnvironment();
    cfg().reset();
  }

  static config::Config& cfg() { return config::Config::getInstance(); }

  static void clearEnvironment() {
    for (const auto* name : kVariables) {
      ::unsetenv(name);
    }
  }

  void useFile(const std::string& contents) {
    auto path = dir.path() / "bot.json";
    std::ofstream(path) << contents;
    ::setenv("DELIVERY_BOT_CONFIG", path.c_str(), 1);
  }

  TempDir dir{"config_test"};
};

TEST_F(ConfigTest, MissingTokenIsAStartupError) {
  EXPECT_THROW(cfg().load(), std::runtime_error);
}

TEST_F(ConfigTest, DefaultsApplyWithOnlyAToken) {
  ::setenv("BOT_TOKEN", "123:abc", 1);
  cfg().load();

  EXPECT_EQ(cfg().getBot().token, "123:abc");
  EXPECT_EQ(cfg().getBot().api_base_url, "https://api.telegram.org");
  EXPECT_FALSE(cfg().getBot().log_chat_id);
  EXPECT_EQ(cfg().getDelivery().max_send_bytes, 50'000'000);
  EXPECT_EQ(cfg().getWorkers().workers, 2u);
  EXPECT_EQ(cfg().getWebhook().mode, config::InboundMode::Polling);
}

TEST_F(ConfigTest, FileOverlaysDefaults) {
  useFile(R"({
    "bot": {"token": "file-token", "log_chat_id": -100123},
    "delivery": {"max_filesize": 20000000, "output_folder": "/tmp/bot", "edit_interval_ms": 2500},
    "workers": {"workers": 3},
    "resolver": {"binary": "/opt/yt-dlp"},
    "webhook": {"enabled": true, "port": 9000, "public_url": "https://bot.example"}
  })");
  cfg().load();

  EXPECT_EQ(cfg().getBot().token, "file-token");
  ASSERT_TRUE(cfg().getBot().log_chat_id);
  EXPECT_EQ(*cfg().getBot().log_chat_id, -100123);
  EXPECT_EQ(cfg().getDelivery().max_send_bytes, 20'000'000);
  EXPECT_EQ(cfg().getDelivery().output_folder, "/tmp/bot");
  EXPECT_EQ(cfg().getDelivery().edit_interval, std::chrono::milliseconds(2500));
  EXPECT_EQ(cfg().getWorkers().workers, 3u);
  EXPECT_EQ(cfg().getResolver().binary, "/opt/yt-dlp");
  EXPECT_EQ(cfg().getWebhook().mode, config::InboundMode::Webhook);
  EXPECT_EQ(cfg().getWebhook().port, 9000);
  EXPECT_EQ(cfg().getWebhook().public_url, "https://bot.example");
}

TEST_F(ConfigTest, EnvironmentWinsOverFile) {
  useFile(R"({"bot": {"token": "file-token"}, "delivery": {"max_filesize": 20000000}, "workers": {"workers": 3}})");
  ::setenv("BOT_TOKEN", "env-token", 1);
  ::setenv("BOT_MAX_FILESIZE", "1000", 1);
  ::setenv("BOT_OUTPUT_DIR", "/var/bot", 1);
  ::setenv("BOT_LOG_CHAT_ID", "42", 1);
  cfg().load();

  EXPECT_EQ(cfg().getBot().token, "env-token");
  EXPECT_EQ(cfg().getDelivery().max_send_bytes, 1000);
  EXPECT_EQ(cfg().getDelivery().output_folder, "/var/bot");
  EXPECT_EQ(cfg().getBot().log_chat_id, std::optional<int64_t>(42));
  EXPECT_EQ(cfg().getWorkers().workers, 3u);
}

TEST_F(ConfigTest, ZeroWorkersIsRaisedToOne) {
  ::setenv("BOT_TOKEN", "t", 1);
  ::setenv("BOT_WORKERS", "0", 1);
  cfg().load();
  EXPECT_EQ(cfg().getWorkers().workers, 1u);
}

TEST_F(ConfigTest, UnreadableFileIsAStartupError) {
  ::setenv("BOT_TOKEN", "t", 1);
  ::setenv("DELIVERY_BOT_CONFIG", (dir.path() / "missing.json").c_str(), 1);
  EXPECT_THROW(cfg().load(), std::runtime_error);

  useFile("{not json");
  EXPECT_THROW(cfg().load(), std::runtime_error);
}

TEST_F(ConfigTest, ResetRestoresDefaults) {
  ::setenv("BOT_TOKEN", "t", 1);
  ::setenv("BOT_MAX_FILESIZE", "1000", 1);
  cfg().load();
  cfg().reset();

  EXPECT_TRUE(cfg().getBot().token.empty());
  EXPECT_EQ(cfg().getDelivery().max_send_bytes, 50'000'000);
}
