#include "adbpush/config.hpp"

#include <picojson.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace adbpush {

namespace {

std::string get_string(const picojson::value& v, const std::string& key,
                       const std::string& def = "") {
  if (!v.is<picojson::object>()) return def;
  const auto& obj = v.get<picojson::object>();
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is<std::string>()) return def;
  return it->second.get<std::string>();
}

int get_int(const picojson::value& v, const std::string& key, int def = 0) {
  if (!v.is<picojson::object>()) return def;
  const auto& obj = v.get<picojson::object>();
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (it->second.is<double>()) {
    double d = it->second.get<double>();
    if (!std::isfinite(d) || d < std::numeric_limits<int>::min() ||
        d > std::numeric_limits<int>::max()) {
      return def;
    }
    return static_cast<int>(d);
  }
  // Ports are sometimes written as strings.
  if (it->second.is<std::string>()) {
    const std::string& s = it->second.get<std::string>();
    char* end = nullptr;
    errno = 0;
    long n = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || !end || *end != '\0' || errno == ERANGE ||
        n < std::numeric_limits<int>::min() ||
        n > std::numeric_limits<int>::max()) {
      return def;
    }
    return static_cast<int>(n);
  }
  return def;
}

}  // namespace

bool is_valid_port(int port) { return port >= 1 && port <= 65535; }

std::string ConfigManager::get_config_dir() {
  const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return std::string(xdg_config) + "/adbpush";
  }

  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::string(home) + "/.config/adbpush";
  }

  return ".config/adbpush";
}

std::string ConfigManager::get_config_path() {
  return get_config_dir() + "/config.json";
}

std::optional<Config> ConfigManager::load_config() {
  return load_config(get_config_path());
}

std::optional<Config> ConfigManager::load_config(const std::string& path) {
  if (!fs::exists(path)) {
    return Config{};
  }

  std::ifstream file(path);
  if (!file) {
    return std::nullopt;
  }

  std::ostringstream ss;
  ss << file.rdbuf();

  picojson::value json;
  std::string err = picojson::parse(json, ss.str());
  if (!err.empty() || !json.is<picojson::object>()) {
    return std::nullopt;
  }

  Config defaults;
  Config config;
  config.destination = get_string(json, "destination", defaults.destination);
  config.address = get_string(json, "address", defaults.address);
  config.port = get_int(json, "port", defaults.port);
  if (!is_valid_port(config.port)) {
    config.port = defaults.port;
  }

  return config;
}

bool ConfigManager::save_config(const Config& config) {
  return save_config(config, get_config_path());
}

bool ConfigManager::save_config(const Config& config, const std::string& path) {
  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return false;
    }
  }

  std::ofstream file(path);
  if (!file) {
    return false;
  }

  picojson::object obj;
  obj["destination"] = picojson::value(config.destination);
  obj["address"] = picojson::value(config.address);
  obj["port"] = picojson::value(static_cast<double>(config.port));

  file << picojson::value(obj).serialize() << "\n";
  return file.good();
}

}  // namespace adbpush
