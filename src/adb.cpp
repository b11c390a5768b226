#include "adbpush/adb.hpp"

#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <utility>

namespace adbpush {

namespace {
struct PipeCloser {
  void operator()(FILE* f) const {
    if (f) pclose(f);
  }
};

using Pipe = std::unique_ptr<FILE, PipeCloser>;

int close_pipe(Pipe& pipe) {
  int status = pclose(pipe.release());
  if (status == -1) {
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

void strip_line_ending(std::string& line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
}
}  // namespace

std::string shell_quote(const std::string& arg) {
  if (!arg.empty() &&
      arg.find_first_of(" '\"\\$`&|;<>()*?[]#~!{}\t\n") == std::string::npos) {
    return arg;
  }

  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

ProcessRunner::ProcessRunner(std::string binary, bool verbose)
    : binary_(std::move(binary)), verbose_(verbose) {}

std::string ProcessRunner::build_command(
    const std::vector<std::string>& args) const {
  std::string cmd = shell_quote(binary_);
  for (const auto& arg : args) {
    cmd += " ";
    cmd += shell_quote(arg);
  }
  cmd += " 2>&1";
  return cmd;
}

std::optional<CommandResult> ProcessRunner::run(
    const std::vector<std::string>& args) {
  std::string cmd = build_command(args);
  if (verbose_) std::cout << "Running: " << cmd << "\n";

  Pipe pipe(popen(cmd.c_str(), "r"));
  if (!pipe) {
    return std::nullopt;
  }

  std::array<char, 4096> buffer;
  CommandResult result;
  size_t n;
  while ((n = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
    result.output.append(buffer.data(), n);
  }

  result.exit_code = close_pipe(pipe);
  return result;
}

std::optional<int> ProcessRunner::stream(const std::vector<std::string>& args,
                                         const LineHandler& on_line) {
  std::string cmd = build_command(args);
  if (verbose_) std::cout << "Streaming: " << cmd << "\n";

  Pipe pipe(popen(cmd.c_str(), "r"));
  if (!pipe) {
    return std::nullopt;
  }

  std::array<char, 4096> buffer;
  std::string line;
  bool keep_reading = true;

  while (keep_reading &&
         fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
    line += buffer.data();
    if (line.empty() || line.back() != '\n') {
      // Partial line, keep filling.
      continue;
    }
    strip_line_ending(line);
    keep_reading = on_line(line);
    line.clear();
  }

  if (keep_reading && !line.empty()) {
    strip_line_ending(line);
    on_line(line);
  }

  return close_pipe(pipe);
}

ScopedEnv::ScopedEnv(std::string name, const std::string& value)
    : name_(std::move(name)) {
  const char* old = std::getenv(name_.c_str());
  if (old) {
    previous_ = std::string(old);
  }
  setenv(name_.c_str(), value.c_str(), 1);
}

ScopedEnv::~ScopedEnv() {
  if (previous_) {
    setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

std::vector<std::string> for_device(const std::string& serial,
                                    std::vector<std::string> args) {
  if (serial.empty()) {
    return args;
  }
  args.insert(args.begin(), {"-s", serial});
  return args;
}

std::optional<std::string> read_remote(AdbRunner& runner,
                                       const std::string& serial,
                                       const std::string& remote_path) {
  auto result =
      runner.run(for_device(serial, {"exec-out", "cat", remote_path}));
  if (!result || result->exit_code != 0) {
    return std::nullopt;
  }
  return result->output;
}

}  // namespace adbpush
