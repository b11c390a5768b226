#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "adbpush/adb.hpp"
#include "adbpush/config.hpp"
#include "adbpush/connection.hpp"
#include "adbpush/output_classifier.hpp"
#include "adbpush/progress.hpp"
#include "adbpush/pusher.hpp"

namespace {

struct Options {
  std::string destination;
  std::string address;
  int port = 0;
  bool port_set = false;
  bool quiet = false;
  bool confirm = false;
  bool verbose = false;
};

void print_usage(const char* prog) {
  std::cout
      << "Usage: " << prog
      << " <command> [options]\n\n"
         "Commands:\n"
         "  push [file...]          Push files (reads paths from stdin if none "
         "or '-')\n"
         "  status                  List devices known to adb\n"
         "  connect                 Connect to the device endpoint\n"
         "  disconnect              Disconnect the device endpoint\n"
         "  read <remote-path>      Print a file from the device\n"
         "  config                  Show or save defaults\n\n"
         "Options:\n"
         "  -d, --destination <dir> Remote directory (default from config)\n"
         "  -a, --address <host>    Device address\n"
         "  -p, --port <port>       Device port (default 5555)\n"
         "  -q, --quiet             Suppress the summary line\n"
         "  --confirm               Ask before each transfer\n"
         "  -v, --verbose           Verbose output\n";
}

adbpush::Endpoint resolve_endpoint(const Options& opts,
                                   const adbpush::Config& config) {
  adbpush::Endpoint endpoint;
  endpoint.address = opts.address.empty() ? config.address : opts.address;
  endpoint.port = opts.port_set ? opts.port : config.port;
  return endpoint;
}

bool connect_or_report(adbpush::ConnectionManager& connection,
                       const adbpush::Endpoint& endpoint) {
  if (endpoint.address.empty()) {
    std::cerr << "No device address. Use -a or 'adbpush config --address'.\n";
    return false;
  }

  auto status = connection.ensure_connected(endpoint);
  if (!adbpush::connected(status)) {
    std::cerr << "Error: " << adbpush::describe(status);
    if (status == adbpush::ConnectResult::Failed) {
      std::cerr << " (" << endpoint.to_string() << ")";
    }
    std::cerr << "\n";
    return false;
  }
  return true;
}

int cmd_push(const std::vector<std::string>& files, const Options& opts,
             const adbpush::Config& config) {
  adbpush::ProcessRunner runner("adb", opts.verbose);
  adbpush::ConnectionManager connection(runner, opts.verbose);
  adbpush::Endpoint endpoint = resolve_endpoint(opts, config);

  bool from_stdin = files.empty() || (files.size() == 1 && files[0] == "-");

  // Prompts go to the terminal when stdin carries the file list; answers
  // must never be taken from the list itself.
  std::ifstream tty;
  if (opts.confirm && from_stdin) {
    tty.open("/dev/tty");
    if (!tty.is_open()) {
      std::cerr << "--confirm with paths on stdin needs a terminal "
                   "(/dev/tty unavailable)\n";
      return 1;
    }
  }
  adbpush::StreamConfirmer confirmer(
      tty.is_open() ? static_cast<std::istream&>(tty) : std::cin, std::cerr);

  if (!connect_or_report(connection, endpoint)) {
    return 1;
  }

  adbpush::PushOptions push_opts;
  push_opts.destination =
      opts.destination.empty() ? config.destination : opts.destination;
  push_opts.serial = endpoint.to_string();
  push_opts.confirm = opts.confirm;
  push_opts.quiet = opts.quiet;
  push_opts.verbose = opts.verbose;

  adbpush::Pusher pusher(runner, push_opts, &confirmer);

  bool show_progress = isatty(STDERR_FILENO) != 0;
  bool progress_line = false;

  pusher.on_progress([&](const adbpush::ProgressEvent& event) {
    if (!show_progress) return;
    std::cerr << "\r  " << event.file << "  " << std::fixed
              << std::setprecision(1) << std::setw(5) << event.percent << "%  "
              << event.rate << "  ETA " << adbpush::format_eta(event.eta_seconds)
              << "   " << std::flush;
    progress_line = true;
  });

  pusher.on_result([&](const adbpush::PushResult& result) {
    if (progress_line) {
      std::cerr << "\n";
      progress_line = false;
    }
    if (result.succeeded()) {
      std::cout << "pushed: " << result.source << " -> "
                << result.remote_path() << "\n";
    } else if (result.failed()) {
      std::cerr << "failed: " << result.source << ": " << result.error()
                << "\n";
    } else {
      std::cerr << "skipped: " << result.source << ": " << result.error()
                << "\n";
    }
  });

  pusher.begin();
  if (from_stdin) {
    std::string line;
    while (std::getline(std::cin, line)) {
      std::string path = adbpush::trim(line);
      if (!path.empty()) pusher.push_one(path);
    }
  } else {
    for (const auto& f : files) {
      pusher.push_one(f);
    }
  }

  const auto& counters = pusher.finish();
  return counters.failed > 0 ? 1 : 0;
}

int cmd_status(const Options& opts) {
  adbpush::ProcessRunner runner("adb", opts.verbose);
  adbpush::ConnectionManager connection(runner, opts.verbose);

  if (!connection.is_tool_available()) {
    std::cerr << "Error: "
              << adbpush::describe(adbpush::ConnectResult::ToolUnavailable)
              << "\n";
    return 1;
  }

  auto devices = connection.list_devices();
  if (devices.empty()) {
    std::cout << "No devices attached.\n";
    return 0;
  }

  std::cout << "Devices:\n";
  for (const auto& d : devices) {
    std::cout << "  " << d.serial << "  " << d.state << "\n";
  }
  return 0;
}

int cmd_connect(const Options& opts, const adbpush::Config& config) {
  adbpush::ProcessRunner runner("adb", opts.verbose);
  adbpush::ConnectionManager connection(runner, opts.verbose);
  adbpush::Endpoint endpoint = resolve_endpoint(opts, config);

  if (!connect_or_report(connection, endpoint)) {
    return 1;
  }
  std::cout << "Connected to " << endpoint.to_string() << "\n";
  return 0;
}

int cmd_disconnect(const Options& opts, const adbpush::Config& config) {
  adbpush::ProcessRunner runner("adb", opts.verbose);
  adbpush::ConnectionManager connection(runner, opts.verbose);
  adbpush::Endpoint endpoint = resolve_endpoint(opts, config);

  if (endpoint.address.empty()) {
    std::cerr << "No device address. Use -a or 'adbpush config --address'.\n";
    return 1;
  }

  if (!connection.disconnect(endpoint)) {
    std::cerr << "Failed to disconnect " << endpoint.to_string() << "\n";
    return 1;
  }
  std::cout << "Disconnected " << endpoint.to_string() << "\n";
  return 0;
}

int cmd_read(const std::string& remote_path, const Options& opts,
             const adbpush::Config& config) {
  adbpush::ProcessRunner runner("adb", opts.verbose);
  adbpush::ConnectionManager connection(runner, opts.verbose);
  adbpush::Endpoint endpoint = resolve_endpoint(opts, config);

  if (!connect_or_report(connection, endpoint)) {
    return 1;
  }

  auto content =
      adbpush::read_remote(runner, endpoint.to_string(), remote_path);
  if (!content) {
    std::cerr << "Failed to read " << remote_path << "\n";
    return 1;
  }

  std::cout << *content << std::flush;
  return 0;
}

int cmd_config(const Options& opts, adbpush::Config config) {
  bool changed = false;
  if (!opts.destination.empty()) {
    config.destination = opts.destination;
    changed = true;
  }
  if (!opts.address.empty()) {
    config.address = opts.address;
    changed = true;
  }
  if (opts.port_set) {
    config.port = opts.port;
    changed = true;
  }

  if (changed) {
    if (!adbpush::ConfigManager::save_config(config)) {
      std::cerr << "Failed to write "
                << adbpush::ConfigManager::get_config_path() << "\n";
      return 1;
    }
    std::cout << "Saved " << adbpush::ConfigManager::get_config_path()
              << "\n";
  }

  std::cout << "destination: " << config.destination << "\n"
            << "address: "
            << (config.address.empty() ? "(unset)" : config.address) << "\n"
            << "port: " << config.port << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  Options opts;
  std::string command;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-d" || arg == "--destination") {
      if (++i < argc) opts.destination = argv[i];
    } else if (arg == "-a" || arg == "--address") {
      if (++i < argc) opts.address = argv[i];
    } else if (arg == "-p" || arg == "--port") {
      if (++i < argc) {
        char* end = nullptr;
        long port = std::strtol(argv[i], &end, 10);
        opts.port = (*argv[i] != '\0' && *end == '\0' && port >= 1 &&
                     port <= 65535)
                        ? static_cast<int>(port)
                        : 0;
        opts.port_set = true;
      }
    } else if (arg == "-q" || arg == "--quiet") {
      opts.quiet = true;
    } else if (arg == "--confirm") {
      opts.confirm = true;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (command.empty()) {
      command = arg;
    } else {
      args.push_back(arg);
    }
  }

  if (command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  if (opts.port_set && !adbpush::is_valid_port(opts.port)) {
    std::cerr << "Port must be 1-65535\n";
    return 1;
  }

  auto loaded = adbpush::ConfigManager::load_config();
  if (!loaded) {
    std::cerr << "Warning: could not parse "
              << adbpush::ConfigManager::get_config_path()
              << ", using defaults\n";
  }
  const adbpush::Config config = loaded ? *loaded : adbpush::Config{};

  if (command == "push") {
    return cmd_push(args, opts, config);
  } else if (command == "status") {
    return cmd_status(opts);
  } else if (command == "connect") {
    return cmd_connect(opts, config);
  } else if (command == "disconnect") {
    return cmd_disconnect(opts, config);
  } else if (command == "read") {
    if (args.empty()) {
      std::cerr << "Usage: adbpush read <remote-path>\n";
      return 1;
    }
    return cmd_read(args[0], opts, config);
  } else if (command == "config") {
    return cmd_config(opts, config);
  } else {
    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
  }
}
