#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace adbpush {

struct ProgressEvent {
  std::string file;
  uint64_t bytes = 0;
  uint64_t total = 0;
  double percent = 0.0;
  double bytes_per_second = 0.0;
  std::string rate;                   // e.g. "3.25 MB/s"
  std::optional<double> eta_seconds;  // Unknown until a rate is known
};

enum class LineKind {
  None,         // Consumed silently (throttled data chunk)
  Error,        // adb reported a hard failure; stop the stream
  Progress,     // Throttle window elapsed, event attached
  Diagnostic,   // Trace noise with no progress information
  Passthrough,  // Regular tool output
};

struct ParsedLine {
  LineKind kind = LineKind::None;
  std::string text;
  std::optional<ProgressEvent> progress;
};

// Byte count from a `writex ... len=<N> ... DATA` trace line, if the line is
// one and the field parses.
std::optional<uint64_t> parse_chunk_length(const std::string& line);

// True for lines carrying adb's own log prefix.
bool is_diagnostic_line(const std::string& line);

std::string format_rate(double bytes_per_second);
std::string format_eta(const std::optional<double>& seconds);

// Turns the ADB_TRACE output of one `adb push` into progress events. One
// instance per transfer.
class ProgressParser {
 public:
  using Clock = std::chrono::steady_clock;

  static constexpr int DEFAULT_THROTTLE_MS = 250;
  static constexpr int DEFAULT_WINDOW = 5;

  ProgressParser(std::string file, uint64_t total_bytes,
                 std::chrono::milliseconds throttle =
                     std::chrono::milliseconds(DEFAULT_THROTTLE_MS),
                 int window = DEFAULT_WINDOW,
                 Clock::time_point start = Clock::now());

  ParsedLine feed(const std::string& line);
  ParsedLine feed(const std::string& line, Clock::time_point now);

  uint64_t bytes_transferred() const { return cumulative_; }
  uint64_t total_bytes() const { return total_; }
  double average_rate() const { return average_; }

 private:
  ProgressEvent sample(Clock::time_point now);

  std::string file_;
  uint64_t total_;
  long long throttle_ms_;
  int window_;

  uint64_t cumulative_ = 0;
  uint64_t last_sample_ = 0;
  double average_ = 0.0;
  Clock::time_point last_emit_;
};

}  // namespace adbpush
