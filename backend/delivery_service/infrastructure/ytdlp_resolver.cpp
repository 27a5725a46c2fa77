#include "ytdlp_resolver.hpp"
#include <charconv>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace delivery_service {

namespace {

const std::string kProgressTemplate =
  std::string("download:") + kProgressMarker +
  " %(progress.status)s %(progress.downloaded_bytes)s %(progress.total_bytes)s"
  " %(progress.total_bytes_estimate)s %(progress.fragment_index)s"
  " %(progress.fragment_count)s %(progress.filename)s";

const std::string kPathTemplate = std::string("after_move:") + kPathMarker + " %(filepath)s";

std::optional<int64_t> parseCount(const std::string& token) {
  if (token.empty() || token == "NA" || token == "None") {
    return std::nullopt;
  }
  double value = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec != std::errc{} || ptr != token.data() + token.size() || value < 0) {
    return std::nullopt;
  }
  return static_cast<int64_t>(value);
}

std::string stringField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

double numberField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return 0;
  }
  return it->get<double>();
}

std::optional<int64_t> sizeField(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return std::nullopt;
  }
  auto value = static_cast<int64_t>(it->get<double>());
  if (value <= 0) {
    return std::nullopt;
  }
  return value;
}

// Paths are taken as given; bare names are looked up on PATH.
boost::filesystem::path executable(const std::string& binary) {
  if (binary.find('/') != std::string::npos) {
    return boost::filesystem::path(binary);
  }
  auto found = bp::search_path(binary);
  if (found.empty()) {
    throw std::runtime_error(binary + " not found in PATH");
  }
  return found;
}

std::string chomp(std::string line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.pop_back();
  }
  return line;
}

} // namespace

std::optional<TransferSignal> parseProgressLine(const std::string& raw) {
  auto line = chomp(raw);
  const std::string marker = std::string(kProgressMarker) + " ";
  if (line.rfind(marker, 0) != 0) {
    return std::nullopt;
  }

  std::istringstream in(line.substr(marker.size()));
  std::string status, downloaded, total, estimate, frag_index, frag_count;
  if (!(in >> status >> downloaded >> total >> estimate >> frag_index >> frag_count)) {
    return std::nullopt;
  }

  TransferSignal signal;
  if (status == "finished") {
    signal.status = TransferSignal::Status::Finished;
  } else if (status == "downloading") {
    signal.status = TransferSignal::Status::Downloading;
  } else {
    return std::nullopt;
  }

  signal.downloaded_bytes = parseCount(downloaded);
  signal.total_bytes = parseCount(total);
  signal.total_bytes_estimate = parseCount(estimate);
  signal.fragment_index = parseCount(frag_index);
  signal.fragment_count = parseCount(frag_count);

  std::string rest;
  std::getline(in, rest);
  auto begin = rest.find_first_not_of(' ');
  if (begin != std::string::npos && rest.substr(begin) != "NA") {
    signal.filename = rest.substr(begin);
  }
  return signal;
}

std::expected<MediaInfo, std::string> parseMediaInfo(const nlohmann::json& j) {
  if (!j.is_object()) {
    return std::unexpected("Metadata is not a JSON object");
  }

  MediaInfo info;
  info.title = stringField(j, "title");
  if (auto it = j.find("duration"); it != j.end() && it->is_number()) {
    info.duration = it->get<double>();
  }

  auto formats = j.find("formats");
  if (formats != j.end() && formats->is_array()) {
    for (const auto& f : *formats) {
      if (!f.is_object()) {
        continue;
      }
      FormatInfo format;
      format.format_id = stringField(f, "format_id");
      format.ext = stringField(f, "ext");
      format.vcodec = stringField(f, "vcodec");
      format.acodec = stringField(f, "acodec");
      format.height = static_cast<int>(numberField(f, "height"));
      format.fps = numberField(f, "fps");
      format.tbr = numberField(f, "tbr");
      format.abr = numberField(f, "abr");
      format.filesize = sizeField(f, "filesize");
      format.filesize_approx = sizeField(f, "filesize_approx");
      format.url = stringField(f, "url");
      info.formats.push_back(std::move(format));
    }
  }
  return info;
}

YtDlpResolver::YtDlpResolver(config::ResolverConfig cfg) : cfg_(std::move(cfg)) {}

std::expected<MediaInfo, std::string> YtDlpResolver::inspect(const std::string& url) {
  std::string output;
  int exit_code = 0;

  try {
    bp::ipstream out;
    std::vector<std::string> args{
      "-J", "--no-playlist", "--no-warnings", "--quiet",
      "--socket-timeout", std::to_string(cfg_.socket_timeout_sec),
      "--", url
    };
    bp::child child(executable(cfg_.binary),
                    bp::args(args),
                    bp::std_out > out, bp::std_err > bp::null, bp::std_in < bp::null);

    std::ostringstream collected;
    collected << out.rdbuf();
    output = collected.str();
    child.wait();
    exit_code = child.exit_code();
  } catch (const std::exception& e) {
    return std::unexpected(std::string("Failed to run ") + cfg_.binary + ": " + e.what());
  }

  if (exit_code != 0) {
    return std::unexpected(cfg_.binary + " exited with code " + std::to_string(exit_code));
  }

  auto j = nlohmann::json::parse(output, nullptr, false);
  if (j.is_discarded()) {
    return std::unexpected("Failed to parse metadata JSON");
  }
  return parseMediaInfo(j);
}

std::vector<std::string> YtDlpResolver::buildFetchArgs(const FetchRequest& request) const {
  std::vector<std::string> args{
    "-f", request.format_spec,
    "-o", request.output_template,
    "--no-playlist",
    "--no-warnings",
    "--newline",
    "--quiet",
    "--progress",
    "--progress-template", kProgressTemplate,
    "--print", kPathTemplate,
    "--concurrent-fragments", std::to_string(cfg_.concurrent_fragments),
    "--retries", std::to_string(cfg_.retries),
    "--fragment-retries", std::to_string(cfg_.fragment_retries),
    "--socket-timeout", std::to_string(cfg_.socket_timeout_sec),
  };

  if (request.max_filesize > 0) {
    args.insert(args.end(), {"--max-filesize", std::to_string(request.max_filesize)});
  }
  if (request.merge_output_format) {
    args.insert(args.end(), {"--merge-output-format", *request.merge_output_format});
  }
  if (request.extract_audio_kbps) {
    args.insert(args.end(), {"-x", "--audio-format", "mp3",
                             "--audio-quality", std::to_string(*request.extract_audio_kbps) + "K"});
  }

  args.insert(args.end(), {"--", request.url});
  return args;
}

std::expected<FetchResult, std::string> YtDlpResolver::fetch(
  const FetchRequest& request,
  SignalObserver observer
) {
  FetchResult result;
  std::string last_error;
  int exit_code = 0;
  const std::string path_marker = std::string(kPathMarker) + " ";

  try {
    bp::ipstream out;
    bp::child child(executable(cfg_.binary),
                    bp::args(buildFetchArgs(request)),
                    (bp::std_out & bp::std_err) > out, bp::std_in < bp::null);

    std::string line;
    while (std::getline(out, line)) {
      line = chomp(line);

      if (line.rfind(path_marker, 0) == 0) {
        result.filepath = std::filesystem::path(line.substr(path_marker.size()));
        continue;
      }
      if (line.rfind("ERROR:", 0) == 0) {
        last_error = line.substr(6);
        auto begin = last_error.find_first_not_of(' ');
        last_error = begin == std::string::npos ? "" : last_error.substr(begin);
        continue;
      }

      auto signal = parseProgressLine(line);
      if (!signal || !observer) {
        continue;
      }
      if (!observer(*signal)) {
        result.aborted = true;
        std::error_code ec;
        child.terminate(ec);
        if (ec) {
          std::cerr << "[resolver] failed to stop " << cfg_.binary << ": " << ec.message() << std::endl;
        }
        break;
      }
    }

    if (result.aborted) {
      return result;
    }
    child.wait();
    exit_code = child.exit_code();
  } catch (const std::exception& e) {
    return std::unexpected(std::string("Failed to run ") + cfg_.binary + ": " + e.what());
  }

  if (exit_code != 0) {
    if (!last_error.empty()) {
      return std::unexpected(last_error);
    }
    return std::unexpected(cfg_.binary + " exited with code " + std::to_string(exit_code));
  }
  return result;
}

}
