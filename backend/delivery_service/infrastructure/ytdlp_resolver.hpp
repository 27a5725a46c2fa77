#pragma once
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/config/config.hpp"
#include "domain/media_resolver.hpp"

namespace delivery_service {

// Marker lines the resolver is told to print on stdout.
inline constexpr const char* kProgressMarker = "[progress]";
inline constexpr const char* kPathMarker = "[path]";

// One line of the progress template:
// "[progress] <status> <downloaded> <total> <estimate> <frag_idx> <frag_count> <filename>"
// with "NA" for absent numbers. Anything else yields nullopt.
std::optional<TransferSignal> parseProgressLine(const std::string& line);

// Metadata JSON as printed by `yt-dlp -J`.
std::expected<MediaInfo, std::string> parseMediaInfo(const nlohmann::json& j);

// Runs the yt-dlp binary as a child process. Inspection parses its JSON dump;
// a fetch streams its progress lines to the observer and kills the child as
// soon as the observer declines a signal.
class YtDlpResolver : public MediaResolver {
public:
  explicit YtDlpResolver(config::ResolverConfig cfg);

  std::expected<MediaInfo, std::string> inspect(const std::string& url) override;

  std::expected<FetchResult, std::string> fetch(
    const FetchRequest& request,
    SignalObserver observer
  ) override;

  std::vector<std::string> buildFetchArgs(const FetchRequest& request) const;

private:
  config::ResolverConfig cfg_;
};

}
