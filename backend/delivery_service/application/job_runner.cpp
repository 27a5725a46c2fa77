#include "job_runner.hpp"
#include "application/callback_token.hpp"
#include "application/text_format.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <system_error>

namespace delivery_service {

namespace fs = std::filesystem;

namespace {

struct DeliveryTarget {
  std::string method;
  std::string file_field;
  std::vector<std::pair<std::string, std::string>> extra_fields;
};

DeliveryTarget targetFor(DeliveryMode mode) {
  switch (mode) {
    case DeliveryMode::Video:
      return {"sendVideo", "video", {{"supports_streaming", "true"}}};
    case DeliveryMode::Document:
      return {"sendDocument", "document", {}};
    case DeliveryMode::Audio:
      return {"sendAudio", "audio", {}};
  }
  return {"sendDocument", "document", {}};
}

bool hasPrefix(const std::string& filename, const std::string& prefix) {
  return filename == prefix ||
    (filename.size() > prefix.size() && filename.rfind(prefix, 0) == 0 && filename[prefix.size()] == '.');
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Removes the job's files and its cancellation entry however run() exits.
struct JobCleanup {
  const fs::path& folder;
  const std::string& prefix;
  CancellationRegistry& cancellations;
  const std::string& job_id;

  ~JobCleanup() {
    JobRunner::removeByPrefix(folder, prefix);
    cancellations.release(job_id);
  }
};

} // namespace

JobRunner::JobRunner(std::shared_ptr<MediaResolver> resolver,
                     std::shared_ptr<ChatClient> chat,
                     StatusChannel& status,
                     CancellationRegistry& cancellations,
                     JobRunnerOptions options)
  : resolver_(std::move(resolver)),
    chat_(std::move(chat)),
    status_(status),
    cancellations_(cancellations),
    options_(std::move(options)) {}

std::string JobRunner::newFilePrefix() {
  static std::atomic<uint32_t> sequence{0};
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  auto seq = sequence.fetch_add(1, std::memory_order_relaxed) % 10000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%013lld%04u", static_cast<long long>(ms), static_cast<unsigned>(seq));
  return buf;
}

std::optional<fs::path> JobRunner::findByPrefix(const fs::path& folder,
                                                const std::string& prefix,
                                                const std::optional<std::string>& prefer_ext) {
  std::error_code ec;
  std::vector<fs::path> matches;
  for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && hasPrefix(it->path().filename().string(), prefix)) {
      matches.push_back(it->path());
    }
  }
  if (matches.empty()) {
    return std::nullopt;
  }

  if (prefer_ext) {
    auto wanted = lower(*prefer_ext);
    for (const auto& p : matches) {
      if (lower(p.extension().string()) == wanted) {
        return p;
      }
    }
  }

  std::optional<fs::path> newest;
  fs::file_time_type newest_time{};
  for (const auto& p : matches) {
    auto t = fs::last_write_time(p, ec);
    if (ec) {
      continue;
    }
    if (!newest || t > newest_time) {
      newest = p;
      newest_time = t;
    }
  }
  return newest;
}

void JobRunner::removeByPrefix(const fs::path& folder, const std::string& prefix) {
  std::error_code ec;
  std::vector<fs::path> doomed;
  for (fs::directory_iterator it(folder, ec), end; !ec && it != end; it.increment(ec)) {
    if (hasPrefix(it->path().filename().string(), prefix)) {
      doomed.push_back(it->path());
    }
  }
  for (const auto& p : doomed) {
    fs::remove_all(p, ec);
    if (ec) {
      std::cerr << "[worker] failed to remove " << p << ": " << ec.message() << std::endl;
    }
  }
}

JobStage JobRunner::run(const DeliveryJob& job) {
  auto token = cancellations_.tokenFor(job.job_id).value_or(CancellationToken{});
  Context ctx{job, token, newFilePrefix()};
  JobCleanup cleanup{options_.output_folder, ctx.prefix, cancellations_, job.job_id};

  try {
    return execute(ctx);
  } catch (const std::exception& e) {
    return finishWithFailure(ctx, {FailureKind::TransferFailure, e.what()});
  }
}

JobStage JobRunner::execute(Context& ctx) {
  if (ctx.token.cancelled()) {
    return finishWithFailure(ctx, {FailureKind::Cancelled, "Cancelled by user"});
  }

  std::error_code ec;
  fs::create_directories(options_.output_folder, ec);
  if (ec) {
    return finishWithFailure(ctx, {FailureKind::TransferFailure, "Cannot create output folder: " + ec.message()});
  }

  transition(ctx, JobStage::Fetching);
  auto fetched = fetch(ctx);
  if (!fetched) {
    return finishWithFailure(ctx, fetched.error());
  }

  transition(ctx, JobStage::Verifying);
  auto artifact = verify(ctx, *fetched);
  if (!artifact) {
    return finishWithFailure(ctx, artifact.error());
  }

  transition(ctx, JobStage::Delivering);
  auto delivered = deliver(ctx, *artifact);
  if (!delivered) {
    return finishWithFailure(ctx, delivered.error());
  }

  // only the delivered media stays in the chat
  publishRemove(ctx);
  transition(ctx, JobStage::Delivered);
  return JobStage::Delivered;
}

std::expected<std::optional<fs::path>, JobFailure> JobRunner::fetch(Context& ctx) {
  const auto& job = ctx.job;
  publishEdit(ctx, status_text::downloading(job.title, 0, std::nullopt, std::nullopt), true);

  FetchRequest request;
  request.url = job.url;
  request.format_spec = fetchSpec(job.plan);
  request.merge_output_format = mergeFormat(job.plan);
  request.output_template = (options_.output_folder / (ctx.prefix + ".%(ext)s")).string();
  request.max_filesize = options_.max_send_bytes;
  if (job.mode == DeliveryMode::Audio) {
    if (const auto* audio = std::get_if<AudioPlan>(&job.plan)) {
      request.extract_audio_kbps = audio->bitrate_kbps;
    } else {
      request.extract_audio_kbps = 128;
    }
  }

  ProgressTracker tracker;
  std::optional<JobFailure> abort_reason;

  auto observer = [&](const TransferSignal& signal) -> bool {
    if (ctx.token.cancelled()) {
      abort_reason = JobFailure{FailureKind::Cancelled, "Cancelled by user"};
      return false;
    }

    // signals for files that are not ours (e.g. thumbnails) are ignored
    if (!signal.filename.empty() &&
        fs::path(signal.filename).filename().string().find(ctx.prefix) == std::string::npos) {
      return true;
    }

    if (signal.status == TransferSignal::Status::Finished) {
      tracker.update(signal);
      publishEdit(ctx, status_text::downloading(job.title, 100, std::nullopt, std::nullopt), true);
      return true;
    }

    if (job.mode != DeliveryMode::Audio && signal.total_bytes && *signal.total_bytes > options_.max_send_bytes) {
      abort_reason = JobFailure{
        FailureKind::SizeExceeded,
        "This video is too large: " + formatBytes(signal.total_bytes) +
          " > limit " + formatBytes(options_.max_send_bytes)
      };
      return false;
    }

    auto reading = tracker.update(signal);
    publishEdit(ctx, status_text::downloading(job.title, reading.percent, reading.downloaded, reading.total), false);
    return true;
  };

  auto result = resolver_->fetch(request, observer);

  if (abort_reason) {
    return std::unexpected(*abort_reason);
  }
  if (ctx.token.cancelled()) {
    return std::unexpected(JobFailure{FailureKind::Cancelled, "Cancelled by user"});
  }
  if (!result) {
    return std::unexpected(JobFailure{FailureKind::TransferFailure, result.error()});
  }
  if (result->aborted) {
    return std::unexpected(JobFailure{FailureKind::TransferFailure, "Download was interrupted"});
  }
  return result->filepath;
}

std::expected<fs::path, JobFailure> JobRunner::verify(Context& ctx, const std::optional<fs::path>& reported) {
  std::error_code ec;
  std::optional<fs::path> artifact;
  if (reported && fs::is_regular_file(*reported, ec)) {
    artifact = *reported;
  } else {
    std::optional<std::string> prefer_ext;
    if (ctx.job.mode == DeliveryMode::Audio) {
      prefer_ext = ".mp3";
    }
    artifact = findByPrefix(options_.output_folder, ctx.prefix, prefer_ext);
  }

  if (!artifact || !fs::exists(*artifact, ec)) {
    return std::unexpected(JobFailure{FailureKind::TransferFailure, "Downloaded file not found"});
  }

  auto size = fs::file_size(*artifact, ec);
  if (ec) {
    return std::unexpected(JobFailure{FailureKind::TransferFailure, "Cannot read downloaded file: " + ec.message()});
  }

  auto final_size = static_cast<int64_t>(size);
  if (final_size > options_.max_send_bytes) {
    return std::unexpected(JobFailure{
      FailureKind::SizeExceeded,
      "This file is " + formatBytes(final_size) + ", which exceeds the limit " +
        formatBytes(options_.max_send_bytes) + "."
    });
  }
  return *artifact;
}

std::expected<void, JobFailure> JobRunner::deliver(Context& ctx, const fs::path& artifact) {
  const auto& job = ctx.job;
  auto target = targetFor(job.mode);

  auto base = sanitizeFilenameBase(job.title);
  std::string send_filename;
  if (job.mode == DeliveryMode::Audio) {
    send_filename = base + ".mp3";
  } else {
    auto ext = artifact.extension().string();
    send_filename = base + (ext.empty() ? ".mp4" : ext);
  }

  UploadRequest request{
    .chat_id = job.chat.chat_id,
    .reply_to_message_id = job.chat.reply_to_message_id,
    .method = target.method,
    .file_field = target.file_field,
    .file_path = artifact,
    .send_filename = send_filename,
    .extra_fields = target.extra_fields
  };

  publishEdit(ctx, status_text::sending(job.title, job.mode, 0), true);

  if (ctx.token.cancelled()) {
    return std::unexpected(JobFailure{FailureKind::Cancelled, "Cancelled by user"});
  }

  auto observer = [&](int64_t sent, int64_t total) -> bool {
    if (ctx.token.cancelled()) {
      return false;
    }
    std::optional<int> pct;
    if (total > 0) {
      pct = static_cast<int>(sent * 100 / total);
    }
    publishEdit(ctx, status_text::sending(job.title, job.mode, pct), false);
    return true;
  };

  auto result = chat_->uploadMedia(request, observer);
  // past the last checkpoint: later presses find nothing to cancel, earlier
  // ones are seen by the check below
  cancellations_.release(job.job_id);

  if (ctx.token.cancelled()) {
    return std::unexpected(JobFailure{FailureKind::Cancelled, "Cancelled by user"});
  }
  if (!result) {
    return std::unexpected(JobFailure{FailureKind::DeliveryFailure, result.error()});
  }
  if (*result == UploadStatus::Aborted) {
    return std::unexpected(JobFailure{FailureKind::DeliveryFailure, "Upload was interrupted"});
  }

  publishEdit(ctx, status_text::sending(job.title, job.mode, 100), true);
  return {};
}

JobStage JobRunner::finishWithFailure(Context& ctx, const JobFailure& failure) {
  // a set flag wins over whatever error the abort surfaced as
  if (failure.kind == FailureKind::Cancelled || ctx.token.cancelled()) {
    publishRemove(ctx);
    transition(ctx, JobStage::Cancelled);
    return JobStage::Cancelled;
  }

  std::cerr << "[worker] job " << ctx.job.job_id << " failed: " << failure.message << std::endl;
  publishEdit(ctx, status_text::error(ctx.job.title, failure.message), true, false);
  // the error text is final, so its throttle history can go
  publishForget(ctx);

  auto terminal = failure.kind == FailureKind::SizeExceeded ? JobStage::Refused : JobStage::Errored;
  transition(ctx, terminal);
  return terminal;
}

void JobRunner::transition(Context& ctx, JobStage next) {
  std::cout << "[worker] job " << ctx.job.job_id << ": "
            << stageName(ctx.stage) << " -> " << stageName(next) << std::endl;
  ctx.stage = next;
}

void JobRunner::publishEdit(const Context& ctx, const std::string& text, bool force, bool with_cancel) {
  status_.publish(StatusUpdate{
    .kind = StatusUpdate::Kind::Edit,
    .chat_id = ctx.job.chat.chat_id,
    .message_id = ctx.job.status_message_id,
    .text = text,
    .keyboard = with_cancel ? cancelKeyboard(ctx.job.job_id) : InlineKeyboard{},
    .force = force
  });
}

void JobRunner::publishRemove(const Context& ctx) {
  status_.publish(StatusUpdate{
    .kind = StatusUpdate::Kind::Remove,
    .chat_id = ctx.job.chat.chat_id,
    .message_id = ctx.job.status_message_id
  });
}

void JobRunner::publishForget(const Context& ctx) {
  status_.publish(StatusUpdate{
    .kind = StatusUpdate::Kind::Forget,
    .chat_id = ctx.job.chat.chat_id,
    .message_id = ctx.job.status_message_id
  });
}

}
