#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace adbpush {

struct CommandResult {
  int exit_code = -1;
  std::string output;
};

// Receives one output line at a time. Returning false stops reading.
using LineHandler = std::function<bool(const std::string&)>;

class AdbRunner {
 public:
  virtual ~AdbRunner() = default;

  virtual std::optional<CommandResult> run(
      const std::vector<std::string>& args) = 0;
  virtual std::optional<int> stream(const std::vector<std::string>& args,
                                    const LineHandler& on_line) = 0;
};

// Runs the adb binary through the shell with stderr merged into stdout.
class ProcessRunner : public AdbRunner {
 public:
  explicit ProcessRunner(std::string binary = "adb", bool verbose = false);

  std::optional<CommandResult> run(
      const std::vector<std::string>& args) override;
  std::optional<int> stream(const std::vector<std::string>& args,
                            const LineHandler& on_line) override;

  std::string build_command(const std::vector<std::string>& args) const;

 private:
  std::string binary_;
  bool verbose_;
};

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
 public:
  ScopedEnv(std::string name, const std::string& value);
  ~ScopedEnv();

  ScopedEnv(const ScopedEnv&) = delete;
  ScopedEnv& operator=(const ScopedEnv&) = delete;

 private:
  std::string name_;
  std::optional<std::string> previous_;
};

std::string shell_quote(const std::string& arg);

// Prefixes `-s <serial>` so the command targets one device. An empty serial
// leaves the choice to adb.
std::vector<std::string> for_device(const std::string& serial,
                                    std::vector<std::string> args);

// Reads a file from the device with `exec-out cat`.
std::optional<std::string> read_remote(AdbRunner& runner,
                                       const std::string& serial,
                                       const std::string& remote_path);

}  // namespace adbpush
