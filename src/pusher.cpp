#include "adbpush/pusher.hpp"

#include <exception>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "adbpush/output_classifier.hpp"

namespace fs = std::filesystem;

namespace adbpush {

std::string PushResult::remote_path() const {
  if (auto* ok = std::get_if<Succeeded>(&outcome)) {
    return ok->remote_path;
  }
  return "";
}

std::string PushResult::error() const {
  if (auto* err = std::get_if<Failed>(&outcome)) {
    return err->error;
  }
  if (auto* skip = std::get_if<Skipped>(&outcome)) {
    return skip->reason;
  }
  return "";
}

std::string remote_path_for(const std::string& destination,
                            const std::string& source) {
  std::string dir = destination;
  while (dir.size() > 1 && dir.back() == '/') {
    dir.pop_back();
  }
  std::string name = fs::path(source).filename().string();
  if (dir == "/") {
    return dir + name;
  }
  return dir + "/" + name;
}

std::string format_summary(const BatchCounters& counters) {
  std::ostringstream ss;
  ss << "Processed " << counters.processed << " file(s): "
     << counters.succeeded << " succeeded, " << counters.failed << " failed, "
     << counters.skipped << " skipped";
  if (counters.declined > 0) {
    ss << ", " << counters.declined << " declined";
  }
  ss << " in " << std::fixed << std::setprecision(2)
     << counters.elapsed_seconds() << "s";
  return ss.str();
}

bool StreamConfirmer::confirm(const std::string& description) {
  prompt_ << description << "? [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(in_, answer)) {
    return false;
  }
  answer = to_lower(trim(answer));
  return answer == "y" || answer == "yes";
}

Pusher::Pusher(AdbRunner& runner, PushOptions options, Confirmer* confirmer)
    : runner_(runner), options_(std::move(options)), confirmer_(confirmer) {}

void Pusher::begin() {
  counters_ = BatchCounters{};
  start_ = std::chrono::steady_clock::now();
  started_ = true;
}

std::optional<PushResult> Pusher::push_one(const std::string& source) {
  if (!started_) begin();

  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    PushResult result{source, Skipped{"file not found"}};
    record(result);
    return result;
  }

  if (options_.confirm && confirmer_) {
    std::string description = "Push " + source + " to " +
                              remote_path_for(options_.destination, source);
    if (!confirmer_->confirm(description)) {
      ++counters_.declined;
      if (options_.verbose) std::cout << "Declined: " << source << "\n";
      return std::nullopt;
    }
  }

  PushResult result = transfer(source);
  record(result);
  return result;
}

PushResult Pusher::transfer(const std::string& source) {
  const std::string remote = remote_path_for(options_.destination, source);

  std::error_code ec;
  uint64_t size = fs::file_size(source, ec);
  if (ec) {
    return {source, Failed{ec.message()}};
  }

  if (options_.verbose) {
    std::cout << "Pushing " << source << " (" << size << " bytes) -> "
              << remote << "\n";
  }

  ProgressParser parser(fs::path(source).filename().string(), size,
                        options_.throttle);
  std::string captured;
  std::string stream_error;
  int diagnostic_lines = 0;
  std::optional<int> status;

  auto handle_line = [&](const std::string& line) {
    ParsedLine parsed = parser.feed(line);
    switch (parsed.kind) {
      case LineKind::Error:
        stream_error = parsed.text;
        return false;
      case LineKind::Progress:
        if (progress_handler_) progress_handler_(*parsed.progress);
        break;
      case LineKind::Diagnostic:
        ++diagnostic_lines;
        break;
      case LineKind::Passthrough:
        captured += line;
        captured += "\n";
        break;
      case LineKind::None:
        break;
    }
    return true;
  };

  try {
    ScopedEnv trace(TRACE_ENV, "all");
    status = runner_.stream(
        for_device(options_.serial, {"push", source, remote}), handle_line);
  } catch (const std::exception& e) {
    return {source, Failed{e.what()}};
  }

  if (options_.verbose) {
    std::cout << "  " << parser.bytes_transferred() << " bytes traced, "
              << diagnostic_lines << " diagnostic line(s) ignored\n";
  }

  if (!status) {
    return {source, Failed{"failed to launch adb"}};
  }

  if (!stream_error.empty()) {
    return {source, Failed{trim(stream_error)}};
  }

  if (!is_success(captured)) {
    std::string detail = first_error_line(captured);
    if (detail.empty()) detail = trim(captured);
    if (detail.empty()) detail = "no output from adb";
    return {source, Failed{detail}};
  }

  return {source, Succeeded{remote}};
}

void Pusher::record(const PushResult& result) {
  ++counters_.processed;
  if (result.succeeded()) {
    ++counters_.succeeded;
  } else if (result.failed()) {
    ++counters_.failed;
  } else {
    ++counters_.skipped;
  }
  counters_.elapsed = std::chrono::steady_clock::now() - start_;

  if (result_handler_) result_handler_(result);
}

const BatchCounters& Pusher::finish(std::ostream& out) {
  if (!started_) begin();
  counters_.elapsed = std::chrono::steady_clock::now() - start_;
  if (!options_.quiet) {
    out << format_summary(counters_) << "\n";
  }
  return counters_;
}

std::vector<PushResult> Pusher::push(const std::vector<std::string>& sources) {
  begin();
  std::vector<PushResult> results;
  for (const auto& source : sources) {
    if (auto result = push_one(source)) {
      results.push_back(std::move(*result));
    }
  }
  finish();
  return results;
}

}  // namespace adbpush
