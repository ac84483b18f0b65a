#pragma once

#include "launchpad/common/result.hpp"
#include "launchpad/discovery/polling.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace launchpad::config {

struct DiscoveryConfig {
  std::int64_t polling_interval_ms = 4000;
  std::int64_t steady_interval_ms = 30000;
  std::int64_t poll_timeout_ms = 30000;
  std::int64_t refresh_timeout_ms = 10000;
  std::vector<std::string> disabled;
};

struct AndroidConfig {
  std::string adb_path = "adb";
};

struct SerialConfig {
  /// Extra /dev name prefixes treated as boards, e.g. "ttyAMA".
  std::vector<std::string> extra_globs;
};

struct LogConfig {
  bool verbose = false;
};

struct Config {
  std::optional<std::string> default_device_id;
  DiscoveryConfig discovery;
  AndroidConfig android;
  SerialConfig serial;
  LogConfig log;
};

[[nodiscard]] const std::vector<std::string> &known_backends();

[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(std::string_view text);

/// Read the config file (a missing file yields defaults) and apply environment overrides.
[[nodiscard]] common::Result<Config> load_config();

void apply_env_overrides(Config &config);

/// Fails on values that cannot work; returns warnings for suspicious ones.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

[[nodiscard]] bool is_backend_enabled(const Config &config, const std::string &name);
[[nodiscard]] discovery::PollingOptions polling_options(const Config &config);

} // namespace launchpad::config
