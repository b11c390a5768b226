#pragma once

#include <optional>
#include <string>

namespace adbpush {

struct Config {
  std::string destination = "/sdcard/Download";
  std::string address;  // Empty = must be given on the command line
  int port = 5555;
};

bool is_valid_port(int port);

class ConfigManager {
 public:
  static std::string get_config_dir();
  static std::string get_config_path();

  static std::optional<Config> load_config();
  static std::optional<Config> load_config(const std::string& path);
  static bool save_config(const Config& config);
  static bool save_config(const Config& config, const std::string& path);
};

}  // namespace adbpush
