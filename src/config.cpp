#include "blendlink/config.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <picojson.h>

namespace fs = std::filesystem;

namespace blendlink {

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
  if (it == obj.end() || !it->second.is<double>()) return def;
  double d = it->second.get<double>();
  if (!std::isfinite(d) || d < INT_MIN || d > INT_MAX) return def;
  return static_cast<int>(d);
}

bool has_key(const picojson::value& v, const std::string& key) {
  return v.is<picojson::object>() && v.get<picojson::object>().count(key) > 0;
}

bool get_bool(const picojson::value& v, const std::string& key, bool def) {
  if (!v.is<picojson::object>()) return def;
  const auto& obj = v.get<picojson::object>();
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is<bool>()) return def;
  return it->second.get<bool>();
}

bool valid_port(long port) {
  return port >= 1 && port <= 65535;
}

std::optional<int> parse_port(const char* text) {
  char* end = nullptr;
  errno = 0;
  long value = std::strtol(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0' || !valid_port(value)) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

}  // namespace

std::string ConfigManager::get_config_dir() {
  const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return std::string(xdg_config) + "/blendlink";
  }

  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::string(home) + "/.config/blendlink";
  }

  return ".config/blendlink";
}

std::string ConfigManager::get_config_path() {
  return get_config_dir() + "/config.json";
}

bool ConfigManager::apply_env_overrides(Config& config) {
  const char* host = std::getenv("BLENDER_HOST");
  if (host && *host) {
    config.host = host;
  }

  const char* port = std::getenv("BLENDER_PORT");
  if (port && *port) {
    auto parsed = parse_port(port);
    if (!parsed) {
      return false;
    }
    config.port = *parsed;
  }

  return true;
}

std::optional<Config> ConfigManager::load_config() {
  Config config;
  std::string path = get_config_path();

  if (fs::exists(path)) {
    std::ifstream file(path);
    if (!file) {
      return std::nullopt;
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    picojson::value json;
    std::string err = picojson::parse(json, ss.str());
    if (!err.empty()) {
      return std::nullopt;
    }

    Config defaults;
    config.host = get_string(json, "host", defaults.host);
    // A present but non-numeric or out-of-range value reads as 0 and is
    // rejected below
    if (has_key(json, "port")) {
      config.port = get_int(json, "port", 0);
    }
    if (has_key(json, "timeout_seconds")) {
      config.timeout_seconds = get_int(json, "timeout_seconds", 0);
    }
    int chunk = get_int(json, "chunk_size", 0);
    if (chunk > 0) {
      config.chunk_size = static_cast<size_t>(chunk);
    }
    config.health_check_command = get_string(json, "health_check_command",
                                             defaults.health_check_command);
    config.verbose = get_bool(json, "verbose", defaults.verbose);

    if (!valid_port(config.port) || config.timeout_seconds <= 0) {
      return std::nullopt;
    }
  }

  if (!apply_env_overrides(config)) {
    return std::nullopt;
  }

  return config;
}

bool ConfigManager::save_config(const Config& config) {
  std::string dir = get_config_dir();
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return false;
  }

  std::string path = get_config_path();
  std::ofstream file(path);
  if (!file) {
    return false;
  }

  picojson::object obj;
  obj["host"] = picojson::value(config.host);
  obj["port"] = picojson::value(static_cast<double>(config.port));
  obj["timeout_seconds"] =
      picojson::value(static_cast<double>(config.timeout_seconds));
  obj["chunk_size"] =
      picojson::value(static_cast<double>(config.chunk_size));
  obj["health_check_command"] = picojson::value(config.health_check_command);
  obj["verbose"] = picojson::value(config.verbose);

  file << picojson::value(obj).serialize(true);
  return file.good();
}

}  // namespace blendlink
