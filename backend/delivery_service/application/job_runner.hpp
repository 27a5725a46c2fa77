#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "application/cancellation_registry.hpp"
#include "application/progress_tracker.hpp"
#include "application/status_channel.hpp"
#include "domain/chat_client.hpp"
#include "domain/job.hpp"
#include "domain/media_resolver.hpp"

namespace delivery_service {

struct JobRunnerOptions {
  std::filesystem::path output_folder;
  int64_t max_send_bytes{0};
};

// Executes one job from claim to a terminal stage on the calling thread:
// fetch, verify the artifact size, upload, then remove every local file with
// the job's prefix and release its cancellation entry.
class JobRunner {
public:
  JobRunner(std::shared_ptr<MediaResolver> resolver,
            std::shared_ptr<ChatClient> chat,
            StatusChannel& status,
            CancellationRegistry& cancellations,
            JobRunnerOptions options);

  JobStage run(const DeliveryJob& job);

  // Fixed-width numeric stem, unique within the process.
  static std::string newFilePrefix();

  // File sharing `prefix` as its stem; `prefer_ext` wins over the most
  // recently modified match.
  static std::optional<std::filesystem::path> findByPrefix(
    const std::filesystem::path& folder,
    const std::string& prefix,
    const std::optional<std::string>& prefer_ext = std::nullopt);

  static void removeByPrefix(const std::filesystem::path& folder, const std::string& prefix);

private:
  struct Context {
    const DeliveryJob& job;
    CancellationToken token;
    std::string prefix;
    JobStage stage{JobStage::Queued};
  };

  JobStage execute(Context& ctx);

  std::expected<std::optional<std::filesystem::path>, JobFailure> fetch(Context& ctx);
  std::expected<std::filesystem::path, JobFailure> verify(Context& ctx, const std::optional<std::filesystem::path>& reported);
  std::expected<void, JobFailure> deliver(Context& ctx, const std::filesystem::path& artifact);

  JobStage finishWithFailure(Context& ctx, const JobFailure& failure);
  void transition(Context& ctx, JobStage next);

  void publishEdit(const Context& ctx, const std::string& text, bool force, bool with_cancel = true);
  void publishRemove(const Context& ctx);
  void publishForget(const Context& ctx);

  std::shared_ptr<MediaResolver> resolver_;
  std::shared_ptr<ChatClient> chat_;
  StatusChannel& status_;
  CancellationRegistry& cancellations_;
  JobRunnerOptions options_;
};

}
