#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "channel.hpp"
#include "frame_reader.hpp"

namespace blendlink {

// Matches the host add-on's own timeout
constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{180000};
constexpr const char* DEFAULT_HEALTH_CHECK_COMMAND = "get_polyhaven_status";

struct Config {
  std::string host = DEFAULT_HOST;
  int port = DEFAULT_PORT;
  int timeout_seconds = static_cast<int>(
      std::chrono::duration_cast<std::chrono::seconds>(DEFAULT_TIMEOUT)
          .count());
  size_t chunk_size = DEFAULT_CHUNK_SIZE;
  std::string health_check_command = DEFAULT_HEALTH_CHECK_COMMAND;
  bool verbose = false;
};

class ConfigManager {
 public:
  static std::string get_config_dir();
  static std::string get_config_path();

  // Defaults, then config.json, then environment. nullopt if the file exists
  // but cannot be read or parsed, if its port is outside 1-65535 or its
  // timeout is not positive, or if BLENDER_PORT is invalid.
  static std::optional<Config> load_config();
  static bool save_config(const Config& config);

  // BLENDER_HOST / BLENDER_PORT. Returns false if BLENDER_PORT is set but is
  // not a valid port; the port is left unchanged in that case.
  static bool apply_env_overrides(Config& config);
};

}  // namespace blendlink
