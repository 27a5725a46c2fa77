#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "domain/delivery_plan.hpp"

namespace delivery_service {

// "512 B", "1.5 MB"; "unknown" for missing or negative sizes.
std::string formatBytes(std::optional<int64_t> bytes);

std::string stripHashtags(const std::string& text);

// Title usable as an upload filename stem.
std::string sanitizeFilenameBase(const std::string& title, size_t max_len = 120);

std::optional<std::string> extractFirstUrl(const std::string& text);

std::string urlScheme(const std::string& url);
std::string urlHost(const std::string& url);

bool isYoutubeHost(const std::string& host);
bool isValidYoutubeUrl(const std::string& url);

// Status message bodies: title, blank line, one status line.
namespace status_text {
std::string queued(const std::string& title, size_t position);
std::string downloading(const std::string& title, std::optional<int> percent,
                        std::optional<int64_t> downloaded, std::optional<int64_t> total);
std::string sending(const std::string& title, DeliveryMode mode, std::optional<int> percent);
std::string error(const std::string& title, const std::string& reason);
}

}
