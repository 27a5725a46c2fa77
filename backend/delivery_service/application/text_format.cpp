#include "text_format.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <regex>

namespace delivery_service {

namespace {

// Multi-byte UTF-8 sequences count as word characters so that hashtags in
// any script are recognised.
bool isWordByte(unsigned char c) {
  return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool isSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
  size_t begin = 0;
  while (begin < s.size() && isSpace(static_cast<unsigned char>(s[begin]))) ++begin;
  size_t end = s.size();
  while (end > begin && isSpace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

std::string rstripChars(std::string s, const std::string& chars) {
  while (!s.empty() && chars.find(s.back()) != std::string::npos) {
    s.pop_back();
  }
  return s;
}

std::string percentSuffix(std::optional<int> percent) {
  if (!percent) {
    return "";
  }
  return " " + std::to_string(std::clamp(*percent, 0, 100)) + "%";
}

} // namespace

std::string formatBytes(std::optional<int64_t> bytes) {
  if (!bytes || *bytes < 0) {
    return "unknown";
  }
  static const char* units[] = {"B", "KB", "MB", "GB"};
  double v = static_cast<double>(*bytes);
  size_t i = 0;
  while (v >= 1024 && i < 3) {
    v /= 1024;
    ++i;
  }
  if (i == 0) {
    return std::to_string(*bytes) + " B";
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[i]);
  return buf;
}

std::string stripHashtags(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    bool boundary = i == 0 || !isWordByte(static_cast<unsigned char>(text[i - 1]));
    if (text[i] == '#' && boundary) {
      size_t j = i + 1;
      while (j < text.size() && (isWordByte(static_cast<unsigned char>(text[j])) || text[j] == '-')) {
        ++j;
      }
      if (j > i + 1) {
        i = j;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }

  // runs of two or more whitespace characters become one space
  std::string collapsed;
  collapsed.reserve(out.size());
  size_t k = 0;
  while (k < out.size()) {
    if (!isSpace(static_cast<unsigned char>(out[k]))) {
      collapsed.push_back(out[k++]);
      continue;
    }
    size_t end = k;
    while (end < out.size() && isSpace(static_cast<unsigned char>(out[end]))) ++end;
    collapsed.push_back(end - k == 1 ? out[k] : ' ');
    k = end;
  }
  return trim(collapsed);
}

std::string sanitizeFilenameBase(const std::string& title, size_t max_len) {
  std::string cleaned;
  for (char c : stripHashtags(title)) {
    auto uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || std::string("<>:\"/\\|?*").find(c) != std::string::npos) {
      continue;
    }
    cleaned.push_back(c);
  }
  cleaned = trim(rstripChars(trim(cleaned), ". "));

  if (cleaned.empty()) {
    return "video";
  }

  if (cleaned.size() > max_len) {
    size_t cut = max_len;
    // do not split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(cleaned[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    cleaned = rstripChars(cleaned.substr(0, cut), " \t");
  }
  return cleaned;
}

std::optional<std::string> extractFirstUrl(const std::string& text) {
  static const std::regex url_re(R"((https?://\S+))");
  auto trimmed = trim(text);
  std::smatch m;
  if (!std::regex_search(trimmed, m, url_re)) {
    return std::nullopt;
  }
  auto url = rstripChars(trim(m[1].str()), ").,]}>\"'");
  if (url.empty()) {
    return std::nullopt;
  }
  return url;
}

std::string urlScheme(const std::string& url) {
  auto pos = url.find("://");
  if (pos == std::string::npos) {
    return "";
  }
  return url.substr(0, pos);
}

std::string urlHost(const std::string& url) {
  auto pos = url.find("://");
  if (pos == std::string::npos) {
    return "";
  }
  auto rest = url.substr(pos + 3);
  auto end = rest.find_first_of("/?#");
  return end == std::string::npos ? rest : rest.substr(0, end);
}

bool isYoutubeHost(const std::string& host) {
  return host == "www.youtube.com" || host == "youtube.com" || host == "youtu.be";
}

bool isValidYoutubeUrl(const std::string& url) {
  static const std::regex youtube_re(
    R"((https?://)?(www\.)?(youtube|youtu|youtube-nocookie)\.(com|be)/(watch\?v=|embed/|v/|.+\?v=)?([^&=%\?]{11}))");
  return std::regex_search(url, youtube_re, std::regex_constants::match_continuous);
}

namespace status_text {

std::string queued(const std::string& title, size_t position) {
  return title + "\n\nQueued (#" + std::to_string(position) + ")";
}

std::string downloading(const std::string& title, std::optional<int> percent,
                        std::optional<int64_t> downloaded, std::optional<int64_t> total) {
  auto line = "Downloading..." + percentSuffix(percent);
  if (downloaded && total && *total > 0) {
    line += "\n" + formatBytes(downloaded) + " / " + formatBytes(total);
  }
  return title + "\n\n" + line;
}

std::string sending(const std::string& title, DeliveryMode mode, std::optional<int> percent) {
  std::string what;
  switch (mode) {
    case DeliveryMode::Video: what = "video"; break;
    case DeliveryMode::Document: what = "document"; break;
    case DeliveryMode::Audio: what = "audio"; break;
  }
  return title + "\n\nSending " + what + "..." + percentSuffix(percent);
}

std::string error(const std::string& title, const std::string& reason) {
  return title + "\n\nError: " + reason;
}

}

}
