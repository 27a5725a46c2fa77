#include <gtest/gtest.h>
#include "application/job_runner.hpp"
#include "fakes.hpp"
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace delivery_service;
using namespace delivery_service::fakes;
namespace fs = std::filesystem;

namespace {

TransferSignal downloading(int64_t done, int64_t total) {
  TransferSignal s;
  s.downloaded_bytes = done;
  s.total_bytes = total;
  return s;
}

// Last edit published for the status message; error jobs follow it with a
// Forget.
const StatusUpdate& lastEdit(const std::vector<StatusUpdate>& updates) {
  for (auto it = updates.rbegin(); it != updates.rend(); ++it) {
    if (it->kind == StatusUpdate::Kind::Edit) {
      return *it;
    }
  }
  throw std::runtime_error("no edit published");
}

TransferSignal finished() {
  TransferSignal s;
  s.status = TransferSignal::Status::Finished;
  return s;
}

}

class JobRunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    resolver->signals = {downloading(512, 1024), finished()};
  }

  DeliveryJob makeJob(DeliveryMode mode, DeliveryPlan plan) {
    DeliveryJob job{
      .job_id = "job1",
      .chat = ChatContext{5, 50},
      .status_message_id = 60,
      .user_id = 7,
      .url = "https://example.com/v",
      .title = "My clip",
      .mode = mode,
      .plan = std::move(plan)
    };
    registry.add(job.job_id, job.user_id, job.chat.chat_id, job.status_message_id);
    return job;
  }

  DeliveryJob videoJob(DeliveryMode mode = DeliveryMode::Video) {
    SingleFilePlan plan;
    plan.format_id = "22";
    plan.size = {1024, true};
    plan.quality_label = "720p";
    return makeJob(mode, plan);
  }

  JobRunner runner(int64_t max_bytes = 50'000'000) {
    return JobRunner(resolver, chat, channel, registry, JobRunnerOptions{dir.path(), max_bytes});
  }

  std::vector<StatusUpdate> drain() {
    std::vector<StatusUpdate> updates;
    while (auto u = channel.tryNext()) {
      updates.push_back(std::move(*u));
    }
    return updates;
  }

  bool folderEmpty() const {
    return fs::is_empty(dir.path());
  }

  TempDir dir{"job_runner_test"};
  std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>();
  std::shared_ptr<FakeChatClient> chat = std::make_shared<FakeChatClient>();
  StatusChannel channel;
  CancellationRegistry registry;
};

TEST_F(JobRunnerTest, DeliversVideoAndCleansUp) {
  auto job = videoJob();
  EXPECT_EQ(runner().run(job), JobStage::Delivered);

  ASSERT_EQ(resolver->requests.size(), 1u);
  EXPECT_EQ(resolver->requests[0].format_spec, "22");
  EXPECT_FALSE(resolver->requests[0].extract_audio_kbps);

  ASSERT_EQ(chat->uploads.size(), 1u);
  const auto& upload = chat->uploads[0];
  EXPECT_EQ(upload.method, "sendVideo");
  EXPECT_EQ(upload.file_field, "video");
  EXPECT_EQ(upload.send_filename, "My clip.mp4");
  EXPECT_EQ(upload.reply_to_message_id, 50);
  ASSERT_EQ(upload.extra_fields.size(), 1u);
  EXPECT_EQ(upload.extra_fields[0].first, "supports_streaming");

  auto updates = drain();
  ASSERT_FALSE(updates.empty());
  EXPECT_EQ(updates.front().text, "My clip\n\nDownloading... 0%");
  EXPECT_EQ(updates.back().kind, StatusUpdate::Kind::Remove);
  EXPECT_EQ(updates.back().message_id, 60);

  EXPECT_TRUE(folderEmpty());
  EXPECT_EQ(registry.size(), 0u);
}

TEST_F(JobRunnerTest, DocumentModeUsesSendDocument) {
  auto job = videoJob(DeliveryMode::Document);
  EXPECT_EQ(runner().run(job), JobStage::Delivered);
  ASSERT_EQ(chat->uploads.size(), 1u);
  EXPECT_EQ(chat->uploads[0].method, "sendDocument");
  EXPECT_TRUE(chat->uploads[0].extra_fields.empty());
}

TEST_F(JobRunnerTest, AudioJobExtractsMp3) {
  resolver->artifact_ext = "mp3";
  auto job = makeJob(DeliveryMode::Audio, AudioPlan{128, 9'600'000, "mp3 128kbps"});
  EXPECT_EQ(runner().run(job), JobStage::Delivered);

  ASSERT_EQ(resolver->requests.size(), 1u);
  EXPECT_EQ(resolver->requests[0].format_spec, "bestaudio/best");
  EXPECT_EQ(resolver->requests[0].extract_audio_kbps, 128);

  ASSERT_EQ(chat->uploads.size(), 1u);
  EXPECT_EQ(chat->uploads[0].method, "sendAudio");
  EXPECT_EQ(chat->uploads[0].send_filename, "My clip.mp3");
}

TEST_F(JobRunnerTest, CancelledBeforeStartNeverFetches) {
  auto job = videoJob();
  registry.requestCancel(job.job_id, job.user_id);

  EXPECT_EQ(runner().run(job), JobStage::Cancelled);
  EXPECT_TRUE(resolver->requests.empty());

  auto updates = drain();
  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].kind, StatusUpdate::Kind::Remove);
}

TEST_F(JobRunnerTest, CancelDuringFetchStopsAndRemovesStatus) {
  auto job = videoJob();
  resolver->before_signal = [&](size_t i) {
    if (i == 1) {
      registry.requestCancel(job.job_id, job.user_id);
    }
  };

  EXPECT_EQ(runner().run(job), JobStage::Cancelled);
  EXPECT_TRUE(chat->uploads.empty());

  auto updates = drain();
  ASSERT_FALSE(updates.empty());
  EXPECT_EQ(updates.back().kind, StatusUpdate::Kind::Remove);
  for (const auto& u : updates) {
    EXPECT_EQ(u.text.find("Error"), std::string::npos);
  }
  EXPECT_TRUE(folderEmpty());
}

TEST_F(JobRunnerTest, CancelDuringUploadStopsDelivery) {
  auto job = videoJob();
  chat->before_chunk = [&](int i) {
    if (i == 1) {
      registry.requestCancel(job.job_id, job.user_id);
    }
  };

  EXPECT_EQ(runner().run(job), JobStage::Cancelled);
  auto updates = drain();
  EXPECT_EQ(updates.back().kind, StatusUpdate::Kind::Remove);
  EXPECT_TRUE(folderEmpty());
}

TEST_F(JobRunnerTest, OversizeArtifactIsRefusedBeforeUpload) {
  resolver->artifact_bytes = 1024;
  resolver->signals = {finished()};
  auto job = videoJob();

  EXPECT_EQ(runner(500).run(job), JobStage::Refused);
  EXPECT_TRUE(chat->uploads.empty());

  auto updates = drain();
  ASSERT_FALSE(updates.empty());
  EXPECT_EQ(updates.back().kind, StatusUpdate::Kind::Forget);
  const auto& last = lastEdit(updates);
  EXPECT_EQ(last.text, "My clip\n\nError: This file is 1.0 KB, which exceeds the limit 500 B.");
  EXPECT_TRUE(last.keyboard.empty());
  EXPECT_TRUE(folderEmpty());
}

TEST_F(JobRunnerTest, ReportedTotalOverCeilingAbortsFetch) {
  resolver->signals = {downloading(10, 10'000), finished()};
  auto job = videoJob();

  EXPECT_EQ(runner(5000).run(job), JobStage::Refused);
  EXPECT_TRUE(chat->uploads.empty());
  auto updates = drain();
  EXPECT_NE(lastEdit(updates).text.find("This video is too large"), std::string::npos);
}

TEST_F(JobRunnerTest, ReportedTotalIsIgnoredForAudio) {
  resolver->artifact_ext = "mp3";
  resolver->signals = {downloading(10, 10'000), finished()};
  auto job = makeJob(DeliveryMode::Audio, AudioPlan{128, 1000, "mp3 128kbps"});

  EXPECT_EQ(runner(5000).run(job), JobStage::Delivered);
}

TEST_F(JobRunnerTest, FetchErrorIsReported) {
  resolver->fetch_error = "Video unavailable";
  auto job = videoJob();

  EXPECT_EQ(runner().run(job), JobStage::Errored);
  auto updates = drain();
  EXPECT_EQ(lastEdit(updates).text, "My clip\n\nError: Video unavailable");
  EXPECT_EQ(registry.size(), 0u);
}

TEST_F(JobRunnerTest, MissingArtifactIsReported) {
  resolver->artifact_bytes = -1;
  resolver->report_path = false;
  auto job = videoJob();

  EXPECT_EQ(runner().run(job), JobStage::Errored);
  auto updates = drain();
  EXPECT_EQ(lastEdit(updates).text, "My clip\n\nError: Downloaded file not found");
}

TEST_F(JobRunnerTest, ArtifactFoundByPrefixWhenPathNotReported) {
  resolver->report_path = false;
  auto job = videoJob();
  EXPECT_EQ(runner().run(job), JobStage::Delivered);
}

TEST_F(JobRunnerTest, UploadFailureIsReported) {
  chat->upload_error = "Telegram API error: Request Entity Too Large";
  auto job = videoJob();

  EXPECT_EQ(runner().run(job), JobStage::Errored);
  auto updates = drain();
  EXPECT_EQ(lastEdit(updates).text, "My clip\n\nError: Telegram API error: Request Entity Too Large");
  EXPECT_TRUE(folderEmpty());
}

TEST_F(JobRunnerTest, FailedJobsLeaveNoReporterHistory) {
  resolver->fetch_error = "boom";
  StatusReporter reporter(chat, std::chrono::milliseconds(1800));

  for (int i = 0; i < 20; ++i) {
    DeliveryJob job{
      .job_id = "job" + std::to_string(i),
      .chat = ChatContext{5, 50},
      .status_message_id = 100 + i,
      .user_id = 7,
      .url = "https://example.com/v",
      .title = "My clip",
      .mode = DeliveryMode::Video,
      .plan = SingleFilePlan{}
    };
    registry.add(job.job_id, job.user_id, job.chat.chat_id, job.status_message_id);
    EXPECT_EQ(runner().run(job), JobStage::Errored);
  }
  for (const auto& u : drain()) {
    StatusPump::apply(u, reporter);
  }

  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(reporter.trackedMessages(), 0u);
  EXPECT_FALSE(chat->edits.empty());
}

TEST_F(JobRunnerTest, CancelPressAfterUploadFindsNothing) {
  auto job = videoJob();
  std::optional<CancelOutcome> late;
  std::thread consumer([&] {
    while (auto u = channel.next()) {
      if (u->kind == StatusUpdate::Kind::Remove) {
        late = registry.requestCancel(job.job_id, job.user_id).outcome;
        return;
      }
    }
  });

  EXPECT_EQ(runner().run(job), JobStage::Delivered);
  channel.close();
  consumer.join();

  ASSERT_TRUE(late);
  EXPECT_EQ(*late, CancelOutcome::NotFound);
}

TEST_F(JobRunnerTest, NonStandardThrowStillCleansUp) {
  resolver->before_signal = [](size_t) { throw 42; };
  auto job = videoJob();

  EXPECT_THROW(runner().run(job), int);
  EXPECT_TRUE(folderEmpty());
  EXPECT_EQ(registry.size(), 0u);
}

TEST(JobRunnerFilesTest, PrefixesAreFixedWidthAndDistinct) {
  auto a = JobRunner::newFilePrefix();
  auto b = JobRunner::newFilePrefix();
  EXPECT_EQ(a.size(), 17u);
  EXPECT_EQ(a.find_first_not_of("0123456789"), std::string::npos);
  EXPECT_NE(a, b);
}

TEST(JobRunnerFilesTest, PrefixMatchingRespectsStemBoundary) {
  TempDir dir("job_runner_files_test");
  for (const auto* name : {"P.mp4", "P.f140.m4a", "P1.mp4"}) {
    std::ofstream(dir.path() / name) << "x";
  }

  auto preferred = JobRunner::findByPrefix(dir.path(), "P", std::string(".m4a"));
  ASSERT_TRUE(preferred);
  EXPECT_EQ(preferred->filename(), "P.f140.m4a");

  JobRunner::removeByPrefix(dir.path(), "P");
  EXPECT_FALSE(fs::exists(dir.path() / "P.mp4"));
  EXPECT_FALSE(fs::exists(dir.path() / "P.f140.m4a"));
  EXPECT_TRUE(fs::exists(dir.path() / "P1.mp4"));
}
