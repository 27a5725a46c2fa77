#include <gtest/gtest.h>
#include "application/status_reporter.hpp"
#include "fakes.hpp"

using namespace delivery_service;
using namespace delivery_service::fakes;
using namespace std::chrono_literals;

class StatusReporterTest : public ::testing::Test {
protected:
  StatusReporter::Clock::time_point now{StatusReporter::Clock::time_point{} + 1h};
  std::shared_ptr<FakeChatClient> chat = std::make_shared<FakeChatClient>();
  StatusReporter reporter{chat, 1800ms, [this] { return now; }};
};

TEST_F(StatusReporterTest, ThrottlesUnforcedEdits) {
  EXPECT_TRUE(reporter.edit(1, 10, "a"));
  now += 500ms;
  EXPECT_FALSE(reporter.edit(1, 10, "b"));
  now += 1500ms;
  EXPECT_TRUE(reporter.edit(1, 10, "c"));
  ASSERT_EQ(chat->edits.size(), 2u);
  EXPECT_EQ(chat->edits[1].text, "c");
}

TEST_F(StatusReporterTest, ForcedEditsBypassThrottle) {
  EXPECT_TRUE(reporter.edit(1, 10, "a"));
  EXPECT_TRUE(reporter.edit(1, 10, "b", {}, true));
  EXPECT_EQ(chat->edits.size(), 2u);
}

TEST_F(StatusReporterTest, SkipsUnchangedText) {
  EXPECT_TRUE(reporter.edit(1, 10, "same"));
  now += 5s;
  EXPECT_FALSE(reporter.edit(1, 10, "same"));
  EXPECT_EQ(chat->edits.size(), 1u);
}

TEST_F(StatusReporterTest, MessagesAreThrottledIndependently) {
  EXPECT_TRUE(reporter.edit(1, 10, "a"));
  EXPECT_TRUE(reporter.edit(1, 11, "a"));
  EXPECT_TRUE(reporter.edit(2, 10, "a"));
  EXPECT_EQ(reporter.trackedMessages(), 3u);
}

TEST_F(StatusReporterTest, FailedEditDoesNotCountAsSent) {
  chat->fail_edits = true;
  EXPECT_FALSE(reporter.edit(1, 10, "a"));
  chat->fail_edits = false;
  EXPECT_TRUE(reporter.edit(1, 10, "a"));
}

TEST_F(StatusReporterTest, RemoveForgetsHistory) {
  reporter.edit(1, 10, "a");
  reporter.remove(1, 10);
  EXPECT_EQ(reporter.trackedMessages(), 0u);
  ASSERT_EQ(chat->deleted.size(), 1u);
  EXPECT_EQ(chat->deleted[0], (std::make_pair<int64_t, int64_t>(1, 10)));
}

TEST_F(StatusReporterTest, SendReturnsMessageId) {
  auto id = reporter.send(5, "hello", 7);
  ASSERT_TRUE(id);
  EXPECT_EQ(*id, 100);
  ASSERT_EQ(chat->sent.size(), 1u);
  EXPECT_EQ(chat->sent[0].reply_to, 7);
}
