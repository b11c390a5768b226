#include "adbpush/connection.hpp"

#include <iostream>
#include <sstream>

namespace adbpush {

std::string Endpoint::to_string() const {
  return address + ":" + std::to_string(port);
}

const char* describe(ConnectResult r) {
  switch (r) {
    case ConnectResult::Connected:
      return "connected";
    case ConnectResult::ToolUnavailable:
      return "adb is not installed or not on PATH";
    case ConnectResult::Failed:
      return "unable to connect to device";
  }
  return "unknown";
}

std::vector<DeviceEntry> parse_device_list(const std::string& output) {
  std::vector<DeviceEntry> devices;
  std::istringstream iss(output);
  std::string line;

  while (std::getline(iss, line)) {
    if (line.rfind("List of devices", 0) == 0 || line.rfind("*", 0) == 0) {
      continue;
    }

    std::istringstream fields(line);
    DeviceEntry entry;
    if (!(fields >> entry.serial >> entry.state)) {
      continue;
    }
    devices.push_back(entry);
  }

  return devices;
}

ConnectionManager::ConnectionManager(AdbRunner& runner, bool verbose)
    : runner_(runner), verbose_(verbose) {}

bool ConnectionManager::is_tool_available() {
  auto result = runner_.run({"version"});
  return result && result->exit_code == 0;
}

std::vector<DeviceEntry> ConnectionManager::list_devices() {
  auto result = runner_.run({"devices"});
  if (!result) {
    return {};
  }
  return parse_device_list(result->output);
}

bool ConnectionManager::is_connected(const Endpoint& endpoint) {
  const std::string serial = endpoint.to_string();
  for (const auto& device : list_devices()) {
    if (device.serial == serial && device.state == "device") {
      return true;
    }
  }
  return false;
}

ConnectResult ConnectionManager::ensure_connected(const Endpoint& endpoint) {
  if (!is_tool_available()) {
    return ConnectResult::ToolUnavailable;
  }

  if (is_connected(endpoint)) {
    if (verbose_) std::cout << "Already connected to " << endpoint.to_string()
                            << "\n";
    return ConnectResult::Connected;
  }

  if (verbose_) std::cout << "Connecting to " << endpoint.to_string() << "\n";

  // Both steps are best-effort; the status query below decides.
  auto tcpip = runner_.run({"tcpip", std::to_string(endpoint.port)});
  if (verbose_ && tcpip) {
    std::cout << "  tcpip exited " << tcpip->exit_code << ": " << tcpip->output;
  }
  auto connect = runner_.run({"connect", endpoint.to_string()});
  if (verbose_ && connect) {
    std::cout << "  connect exited " << connect->exit_code << ": "
              << connect->output;
  }

  return is_connected(endpoint) ? ConnectResult::Connected
                                : ConnectResult::Failed;
}

bool ConnectionManager::disconnect(const Endpoint& endpoint) {
  auto result = runner_.run({"disconnect", endpoint.to_string()});
  if (verbose_ && result) {
    std::cout << "disconnect exited " << result->exit_code << ": "
              << result->output;
  }
  return !is_connected(endpoint);
}

}  // namespace adbpush
