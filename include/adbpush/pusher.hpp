#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "adb.hpp"
#include "progress.hpp"

namespace adbpush {

struct Succeeded {
  std::string remote_path;
};

struct Failed {
  std::string error;
};

struct Skipped {
  std::string reason;
};

using PushOutcome = std::variant<Succeeded, Failed, Skipped>;

struct PushResult {
  std::string source;
  PushOutcome outcome;

  bool succeeded() const { return std::holds_alternative<Succeeded>(outcome); }
  bool failed() const { return std::holds_alternative<Failed>(outcome); }
  bool skipped() const { return std::holds_alternative<Skipped>(outcome); }

  // Empty unless the push succeeded.
  std::string remote_path() const;
  // Failure or skip detail; empty on success.
  std::string error() const;
};

struct BatchCounters {
  int processed = 0;
  int succeeded = 0;
  int failed = 0;
  int skipped = 0;
  int declined = 0;
  std::chrono::steady_clock::duration elapsed{};

  double elapsed_seconds() const {
    return std::chrono::duration<double>(elapsed).count();
  }
};

class Confirmer {
 public:
  virtual ~Confirmer() = default;
  virtual bool confirm(const std::string& description) = 0;
};

class AlwaysConfirm : public Confirmer {
 public:
  bool confirm(const std::string&) override { return true; }
};

// Prompts on `prompt` and accepts "y"/"yes" read from `in`. End of input
// declines.
class StreamConfirmer : public Confirmer {
 public:
  StreamConfirmer(std::istream& in, std::ostream& prompt)
      : in_(in), prompt_(prompt) {}

  bool confirm(const std::string& description) override;

 private:
  std::istream& in_;
  std::ostream& prompt_;
};

struct PushOptions {
  std::string destination;
  std::string serial;    // Target device for `adb -s`, e.g. "10.0.0.5:5555"
  bool confirm = false;  // Ask the Confirmer before each transfer
  bool quiet = false;    // No summary line
  bool verbose = false;
  std::chrono::milliseconds throttle{ProgressParser::DEFAULT_THROTTLE_MS};
};

using ProgressHandler = std::function<void(const ProgressEvent&)>;
using ResultHandler = std::function<void(const PushResult&)>;

std::string remote_path_for(const std::string& destination,
                            const std::string& source);
std::string format_summary(const BatchCounters& counters);

class Pusher {
 public:
  static constexpr const char* TRACE_ENV = "ADB_TRACE";

  Pusher(AdbRunner& runner, PushOptions options,
         Confirmer* confirmer = nullptr);

  void on_progress(ProgressHandler handler) {
    progress_handler_ = std::move(handler);
  }
  void on_result(ResultHandler handler) { result_handler_ = std::move(handler); }

  // Resets counters and starts the batch clock.
  void begin();
  // Processes one item. Returns nothing when the item was declined at the
  // confirmation gate.
  std::optional<PushResult> push_one(const std::string& source);
  // Prints the summary unless quiet.
  const BatchCounters& finish(std::ostream& out = std::cout);

  std::vector<PushResult> push(const std::vector<std::string>& sources);

  const BatchCounters& counters() const { return counters_; }
  const PushOptions& options() const { return options_; }

 private:
  PushResult transfer(const std::string& source);
  void record(const PushResult& result);

  AdbRunner& runner_;
  PushOptions options_;
  Confirmer* confirmer_;
  ProgressHandler progress_handler_;
  ResultHandler result_handler_;

  BatchCounters counters_;
  std::chrono::steady_clock::time_point start_;
  bool started_ = false;
};

}  // namespace adbpush
