#include "adbpush/progress.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <utility>

#include "adbpush/output_classifier.hpp"

namespace adbpush {

namespace {

constexpr const char* TRACE_TAG = "writex";
constexpr const char* DATA_TAG = "DATA";
constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

bool starts_with_error_marker(const std::string& line) {
  size_t begin = line.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return false;
  }
  return line.compare(begin, std::char_traits<char>::length(ADB_ERROR_MARKER),
                      ADB_ERROR_MARKER) == 0;
}

}  // namespace

std::optional<uint64_t> parse_chunk_length(const std::string& line) {
  // Only adb's own trace output counts; file names in adb's stdout may
  // contain the same tags.
  if (!is_diagnostic_line(line) ||
      line.find(TRACE_TAG) == std::string::npos ||
      line.find(DATA_TAG) == std::string::npos) {
    return std::nullopt;
  }

  static const std::regex len_re("len=([0-9]+)\\b");
  std::smatch m;
  if (!std::regex_search(line, m, len_re)) {
    return std::nullopt;
  }

  const std::string digits = m[1].str();
  if (digits.size() > 19) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (char c : digits) {
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

bool is_diagnostic_line(const std::string& line) {
  // "adb D ..." / "adb: ...", bare "writex: ..." transport traces and
  // logcat-style host trace headers.
  static const std::regex prefix_re(
      "^(adb [VDIWEF] |adb: |writex[: ]|"
      "[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}(\\.[0-9]+)?"
      "\\s+[0-9]+\\s+[0-9]+\\s+[VDIWEF]\\s)");
  return std::regex_search(line, prefix_re);
}

std::string format_rate(double bytes_per_second) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2)
     << std::max(0.0, bytes_per_second) / BYTES_PER_MB << " MB/s";
  return ss.str();
}

std::string format_eta(const std::optional<double>& seconds) {
  if (!seconds || !std::isfinite(*seconds)) {
    return "--:--";
  }
  long long total = static_cast<long long>(std::ceil(*seconds));
  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(2) << total / 60 << ":"
     << std::setw(2) << total % 60;
  return ss.str();
}

ProgressParser::ProgressParser(std::string file, uint64_t total_bytes,
                               std::chrono::milliseconds throttle, int window,
                               Clock::time_point start)
    : file_(std::move(file)),
      total_(total_bytes),
      throttle_ms_(std::max<long long>(1, throttle.count())),
      window_(std::max(1, window)),
      last_emit_(start) {}

ParsedLine ProgressParser::feed(const std::string& line) {
  return feed(line, Clock::now());
}

ParsedLine ProgressParser::feed(const std::string& line,
                                Clock::time_point now) {
  ParsedLine parsed;
  parsed.text = line;

  if (starts_with_error_marker(line)) {
    parsed.kind = LineKind::Error;
    return parsed;
  }

  if (auto len = parse_chunk_length(line)) {
    cumulative_ += *len;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now - last_emit_)
                       .count();
    if (elapsed < throttle_ms_) {
      parsed.kind = LineKind::None;
      return parsed;
    }

    parsed.kind = LineKind::Progress;
    parsed.progress = sample(now);
    return parsed;
  }

  if (is_diagnostic_line(line)) {
    parsed.kind = LineKind::Diagnostic;
    return parsed;
  }

  parsed.kind = LineKind::Passthrough;
  return parsed;
}

ProgressEvent ProgressParser::sample(Clock::time_point now) {
  double instantaneous = static_cast<double>(cumulative_ - last_sample_) *
                         (1000.0 / static_cast<double>(throttle_ms_));
  average_ = (average_ * (window_ - 1) + instantaneous) / window_;

  ProgressEvent event;
  event.file = file_;
  event.bytes = cumulative_;
  event.total = total_;
  event.bytes_per_second = average_;
  event.rate = format_rate(average_);

  if (total_ == 0) {
    event.percent = 100.0;
  } else {
    event.percent = std::min(
        100.0, static_cast<double>(cumulative_) / total_ * 100.0);
  }

  if (average_ > 0.0) {
    uint64_t remaining = total_ > cumulative_ ? total_ - cumulative_ : 0;
    event.eta_seconds = static_cast<double>(remaining) / average_;
  }

  last_sample_ = cumulative_;
  last_emit_ = now;
  return event;
}

}  // namespace adbpush
