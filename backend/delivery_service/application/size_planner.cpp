#include "size_planner.hpp"
#include <iostream>
#include <tuple>

namespace delivery_service {

namespace {

// Lexicographic ranking for video renditions: height, then frame rate, then
// total bitrate.
using VideoRank = std::tuple<int, int, double>;

VideoRank videoRank(const FormatInfo& f) {
  return {f.height, static_cast<int>(f.fps), f.tbr};
}

double audioRank(const FormatInfo& f) {
  if (f.abr > 0) return f.abr;
  if (f.tbr > 0) return f.tbr;
  return 0;
}

std::string heightLabel(int height) {
  return height > 0 ? std::to_string(height) + "p" : "mp4";
}

bool isHttpUrl(const std::string& url) {
  return url.rfind("http", 0) == 0;
}

} // namespace

SizePlanner::SizePlanner(std::shared_ptr<SizeProber> prober)
  : prober_(std::move(prober)) {}

SizeEstimate SizePlanner::estimateSize(const FormatInfo& format, std::optional<int64_t> duration_sec) {
  if (format.filesize && *format.filesize > 0) {
    return {*format.filesize, true};
  }
  if (format.filesize_approx && *format.filesize_approx > 0) {
    return {*format.filesize_approx, true};
  }

  // Bitrate guesses are display hints only and never gate a transfer.
  if (duration_sec && format.tbr > 0) {
    auto est = static_cast<int64_t>(static_cast<double>(*duration_sec) * (format.tbr * 1000.0 / 8.0));
    if (est > 0) {
      return {est, false};
    }
  }
  return {std::nullopt, false};
}

std::optional<SingleFilePlan> SizePlanner::bestSingleFile(const MediaInfo& info) const {
  auto duration = durationSeconds(info);
  const FormatInfo* best = nullptr;
  VideoRank best_rank{};

  for (const auto& f : info.formats) {
    if (f.ext != "mp4" || !f.hasVideo() || !f.hasAudio()) {
      continue;
    }
    auto rank = videoRank(f);
    // strict comparison keeps the first of equal candidates
    if (best == nullptr || rank > best_rank) {
      best = &f;
      best_rank = rank;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }

  SingleFilePlan plan;
  plan.format_id = best->format_id;
  plan.size = estimateSize(*best, duration);
  if (!best->url.empty()) {
    plan.probe_targets.push_back(best->url);
  }
  plan.quality_label = heightLabel(best->height);
  return plan;
}

std::optional<PairedStreamPlan> SizePlanner::bestPairedStreams(const MediaInfo& info) const {
  auto duration = durationSeconds(info);
  const FormatInfo* best_video = nullptr;
  VideoRank best_video_rank{};
  const FormatInfo* best_audio = nullptr;
  double best_audio_rank = 0;

  for (const auto& f : info.formats) {
    if (f.ext == "mp4" && f.hasVideo() && !f.hasAudio()) {
      auto rank = videoRank(f);
      if (best_video == nullptr || rank > best_video_rank) {
        best_video = &f;
        best_video_rank = rank;
      }
    }

    if (!f.hasVideo() && f.hasAudio() && (f.ext == "m4a" || f.ext == "mp4")) {
      auto rank = audioRank(f);
      if (best_audio == nullptr || rank > best_audio_rank) {
        best_audio = &f;
        best_audio_rank = rank;
      }
    }
  }

  if (best_video == nullptr || best_audio == nullptr) {
    return std::nullopt;
  }

  auto video_size = estimateSize(*best_video, duration);
  auto audio_size = estimateSize(*best_audio, duration);

  PairedStreamPlan plan;
  plan.video_format_id = best_video->format_id;
  plan.audio_format_id = best_audio->format_id;
  plan.merge_format = "mp4";
  if (video_size.bytes && audio_size.bytes) {
    plan.size.bytes = *video_size.bytes + *audio_size.bytes;
    plan.size.confident = video_size.confident && audio_size.confident;
  }
  if (!best_video->url.empty()) {
    plan.probe_targets.push_back(best_video->url);
  }
  if (!best_audio->url.empty()) {
    plan.probe_targets.push_back(best_audio->url);
  }
  plan.quality_label = heightLabel(best_video->height);
  return plan;
}

DeliveryPlan SizePlanner::selectVideoPlan(const MediaInfo& info) const {
  if (auto single = bestSingleFile(info)) {
    return *single;
  }
  if (auto paired = bestPairedStreams(info)) {
    return *paired;
  }
  return UnresolvedPlan{};
}

DeliveryPlan SizePlanner::applyProbe(const DeliveryPlan& plan) const {
  auto size = sizeOf(plan);
  if (size.confident && size.bytes) {
    return plan;
  }
  if (!prober_) {
    return plan;
  }

  std::vector<std::string> urls;
  for (const auto& url : probeTargets(plan)) {
    if (isHttpUrl(url)) {
      urls.push_back(url);
    }
  }
  if (urls.empty()) {
    return plan;
  }

  int64_t total = 0;
  for (const auto& url : urls) {
    auto probed = prober_->probeTotalSize(url);
    if (!probed || *probed <= 0) {
      std::cout << "[planner] size probe inconclusive: "
                << (probed ? "empty total" : probed.error()) << std::endl;
      return plan;
    }
    total += *probed;
  }

  SizeEstimate confirmed{total, true};
  return std::visit(overloaded{
    [&](SingleFilePlan p) -> DeliveryPlan { p.size = confirmed; return p; },
    [&](PairedStreamPlan p) -> DeliveryPlan { p.size = confirmed; return p; },
    [&](UnresolvedPlan p) -> DeliveryPlan { return p; },
    [&](AudioPlan p) -> DeliveryPlan { return p; },
  }, plan);
}

DeliveryPlan SizePlanner::plan(const MediaInfo& info) const {
  return applyProbe(selectVideoPlan(info));
}

}
