#include <gtest/gtest.h>
#include "infrastructure/http_client.hpp"
#include "infrastructure/range_prober.hpp"

using namespace delivery_service;

TEST(RangeProberTest, TotalFromContentRange) {
  EXPECT_EQ(parseProbedTotal("bytes 0-0/123456", ""), 123456);
  EXPECT_EQ(parseProbedTotal("bytes 0-0/123456  ", "1"), 123456);
}

TEST(RangeProberTest, UnknownTotalFallsBackToLength) {
  EXPECT_EQ(parseProbedTotal("bytes 0-0/*", "5000000"), 5000000);
  EXPECT_EQ(parseProbedTotal("", "5000000"), 5000000);
}

TEST(RangeProberTest, SmallLengthIsNotTrusted) {
  EXPECT_FALSE(parseProbedTotal("", "1"));
  EXPECT_FALSE(parseProbedTotal("", std::to_string(kMinTrustedContentLength)));
  EXPECT_FALSE(parseProbedTotal("", "abc"));
  EXPECT_FALSE(parseProbedTotal("bytes 0-0/0", ""));
}

TEST(HttpClientTest, RetriesConfiguredStatuses) {
  HttpClient client(config::HttpClientConfig{
    .max_retries = 4,
    .backoff_factor = 0.6,
    .retry_statuses = {429, 500, 502, 503, 504},
    .probe_timeout = std::chrono::seconds(10),
    .api_timeout = std::chrono::seconds(30),
    .poll_timeout = std::chrono::seconds(25),
    .upload_connect_timeout = std::chrono::seconds(20),
    .upload_timeout = std::chrono::seconds(1800)
  });

  EXPECT_TRUE(client.shouldRetry(429));
  EXPECT_TRUE(client.shouldRetry(503));
  EXPECT_FALSE(client.shouldRetry(404));
  EXPECT_FALSE(client.shouldRetry(200));

  EXPECT_EQ(client.backoff(0).count(), 0);
  EXPECT_EQ(client.backoff(1).count(), 600);
  EXPECT_EQ(client.backoff(3).count(), 2400);
}
