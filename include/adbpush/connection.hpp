#pragma once

#include <string>
#include <vector>

#include "adb.hpp"

namespace adbpush {

struct Endpoint {
  std::string address;
  int port = 5555;

  std::string to_string() const;
};

struct DeviceEntry {
  std::string serial;
  std::string state;
};

enum class ConnectResult { Connected, ToolUnavailable, Failed };

inline bool connected(ConnectResult r) {
  return r == ConnectResult::Connected;
}

const char* describe(ConnectResult r);

// Parses the table printed by `adb devices`.
std::vector<DeviceEntry> parse_device_list(const std::string& output);

class ConnectionManager {
 public:
  explicit ConnectionManager(AdbRunner& runner, bool verbose = false);

  bool is_tool_available();
  std::vector<DeviceEntry> list_devices();
  bool is_connected(const Endpoint& endpoint);

  // Makes at most one connection attempt; already-connected endpoints are
  // left untouched.
  ConnectResult ensure_connected(const Endpoint& endpoint);
  bool disconnect(const Endpoint& endpoint);

 private:
  AdbRunner& runner_;
  bool verbose_;
};

}  // namespace adbpush
