#include "test_framework.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "blendlink/config.hpp"
#include "blendlink/dispatcher.hpp"

namespace fs = std::filesystem;

namespace {

// Points XDG_CONFIG_HOME at a fresh directory and clears the BLENDER_*
// overrides for the lifetime of the object.
class ScopedConfigHome {
 public:
  ScopedConfigHome() {
    char tmpl[] = "/tmp/blendlink-test-XXXXXX";
    char* dir = mkdtemp(tmpl);
    if (dir == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    dir_ = dir;
    setenv("XDG_CONFIG_HOME", dir_.c_str(), 1);
    unsetenv("BLENDER_HOST");
    unsetenv("BLENDER_PORT");
  }

  ~ScopedConfigHome() {
    unsetenv("XDG_CONFIG_HOME");
    unsetenv("BLENDER_HOST");
    unsetenv("BLENDER_PORT");
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void write_config(const std::string& text) {
    fs::create_directories(dir_ + "/blendlink");
    std::ofstream(dir_ + "/blendlink/config.json") << text;
  }

  const std::string& dir() const { return dir_; }

 private:
  std::string dir_;
};

}  // namespace

TEST(ConfigPathFollowsXdg) {
  ScopedConfigHome home;
  ASSERT_EQ(blendlink::ConfigManager::get_config_path(),
            home.dir() + "/blendlink/config.json");
}

TEST(ConfigDefaultsWithoutFile) {
  ScopedConfigHome home;
  auto config = blendlink::ConfigManager::load_config();
  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(config->host, std::string("localhost"));
  ASSERT_EQ(config->port, 9876);
  ASSERT_EQ(config->timeout_seconds, 180);
  ASSERT_EQ(config->chunk_size, 8192u);
  ASSERT_EQ(config->health_check_command, std::string("get_polyhaven_status"));
  ASSERT_FALSE(config->verbose);
}

TEST(ConfigFileOverridesDefaults) {
  ScopedConfigHome home;
  home.write_config(
      "{\"host\": \"10.0.0.5\", \"port\": 9900, \"timeout_seconds\": 30, "
      "\"chunk_size\": 4096, \"verbose\": true}");

  auto config = blendlink::ConfigManager::load_config();
  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(config->host, std::string("10.0.0.5"));
  ASSERT_EQ(config->port, 9900);
  ASSERT_EQ(config->timeout_seconds, 30);
  ASSERT_EQ(config->chunk_size, 4096u);
  ASSERT_EQ(config->health_check_command, std::string("get_polyhaven_status"));
  ASSERT_TRUE(config->verbose);
}

TEST(EnvironmentOverridesFile) {
  ScopedConfigHome home;
  home.write_config("{\"host\": \"10.0.0.5\", \"port\": 9900}");
  setenv("BLENDER_HOST", "192.168.1.20", 1);
  setenv("BLENDER_PORT", "9877", 1);

  auto config = blendlink::ConfigManager::load_config();
  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(config->host, std::string("192.168.1.20"));
  ASSERT_EQ(config->port, 9877);
}

TEST(InvalidEnvironmentPort) {
  ScopedConfigHome home;

  blendlink::Config config;
  setenv("BLENDER_PORT", "98x6", 1);
  ASSERT_FALSE(blendlink::ConfigManager::apply_env_overrides(config));
  ASSERT_EQ(config.port, 9876);

  setenv("BLENDER_PORT", "70000", 1);
  ASSERT_FALSE(blendlink::ConfigManager::apply_env_overrides(config));
  ASSERT_FALSE(blendlink::ConfigManager::load_config().has_value());
}

TEST(InvalidConfigFile) {
  ScopedConfigHome home;
  home.write_config("{\"host\": ");
  ASSERT_FALSE(blendlink::ConfigManager::load_config().has_value());
}

TEST(InvalidNumbersInConfigFile) {
  ScopedConfigHome home;

  home.write_config("{\"port\": 1e12}");
  ASSERT_FALSE(blendlink::ConfigManager::load_config().has_value());

  home.write_config("{\"port\": 0}");
  ASSERT_FALSE(blendlink::ConfigManager::load_config().has_value());

  home.write_config("{\"port\": \"9876\"}");
  ASSERT_FALSE(blendlink::ConfigManager::load_config().has_value());

  home.write_config("{\"timeout_seconds\": -5}");
  ASSERT_FALSE(blendlink::ConfigManager::load_config().has_value());

  home.write_config("{\"timeout_seconds\": 1e300}");
  ASSERT_FALSE(blendlink::ConfigManager::load_config().has_value());
}

TEST(ConfigDefaultsMatchLibraryDefaults) {
  blendlink::Config config;
  ASSERT_EQ(config.host, std::string(blendlink::DEFAULT_HOST));
  ASSERT_EQ(config.port, blendlink::DEFAULT_PORT);
  ASSERT_EQ(config.chunk_size, blendlink::DEFAULT_CHUNK_SIZE);
  ASSERT_EQ(config.health_check_command,
            std::string(blendlink::DEFAULT_HEALTH_CHECK_COMMAND));

  blendlink::DispatchOptions options;
  ASSERT_EQ(std::chrono::milliseconds(
                std::chrono::seconds(config.timeout_seconds)),
            options.timeout);
}

TEST(SavedConfigLoadsBack) {
  ScopedConfigHome home;

  blendlink::Config config;
  config.host = "127.0.0.1";
  config.port = 9100;
  config.health_check_command = "get_scene_info";
  ASSERT_TRUE(blendlink::ConfigManager::save_config(config));

  auto loaded = blendlink::ConfigManager::load_config();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->host, std::string("127.0.0.1"));
  ASSERT_EQ(loaded->port, 9100);
  ASSERT_EQ(loaded->health_check_command, std::string("get_scene_info"));
}

TEST(DispatcherFromConfig) {
  blendlink::Config config;
  config.timeout_seconds = 42;
  config.health_check_command = "get_scene_info";
  config.host = "127.0.0.1";

  auto dispatcher = blendlink::Dispatcher::from_config(config);
  ASSERT_EQ(dispatcher->options().timeout, std::chrono::milliseconds(42000));
  ASSERT_EQ(dispatcher->options().health_check_command,
            std::string("get_scene_info"));
  ASSERT_FALSE(dispatcher->is_connected());
}
