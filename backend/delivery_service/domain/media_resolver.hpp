#pragma once
#include "media.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace delivery_service {

// One progress report from a running fetch.
struct TransferSignal {
  enum class Status { Downloading, Finished };
  Status status{Status::Downloading};
  std::optional<int64_t> downloaded_bytes;
  std::optional<int64_t> total_bytes;
  std::optional<int64_t> total_bytes_estimate;
  std::optional<int64_t> fragment_index;
  std::optional<int64_t> fragment_count;
  std::string filename;
};

struct FetchRequest {
  std::string url;
  std::string format_spec;
  std::optional<std::string> merge_output_format;
  std::string output_template;            // "<dir>/<prefix>.%(ext)s"
  int64_t max_filesize{0};
  std::optional<int> extract_audio_kbps;  // mp3 extraction when set
};

struct FetchResult {
  std::optional<std::filesystem::path> filepath;
  bool aborted{false};  // the observer asked to stop
};

class MediaResolver {
public:
  // Returning false from the observer stops the fetch at that signal.
  using SignalObserver = std::function<bool(const TransferSignal&)>;
  virtual ~MediaResolver() = default;

  virtual std::expected<MediaInfo, std::string> inspect(const std::string& url) = 0;

  virtual std::expected<FetchResult, std::string> fetch(
    const FetchRequest& request,
    SignalObserver observer
  ) = 0;
};

class SizeProber {
public:
  virtual ~SizeProber() = default;
  // Total byte size of the resource behind `url`, without fetching its body.
  virtual std::expected<int64_t, std::string> probeTotalSize(const std::string& url) = 0;
};

} // namespace delivery_service
