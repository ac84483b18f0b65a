#include "launchpad/config/config.hpp"

#include "launchpad/common/fs.hpp"
#include "launchpad/common/toml.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace launchpad::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".launchpad";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("LAUNCHPAD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

common::Result<std::string> read_config_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return common::Result<std::string>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return common::Result<std::string>::success(buffer.str());
}

} // namespace

const std::vector<std::string> &known_backends() {
  static const std::vector<std::string> names = {"linux", "web-server", "android", "serial"};
  return names;
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<Config> parse_config(const std::string_view text) {
  const auto parsed = common::parse_toml(text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  if (doc.has("devices.default_id")) {
    const auto id = common::trim(doc.get_string("devices.default_id"));
    if (!id.empty()) {
      config.default_device_id = id;
    }
  }

  auto &discovery = config.discovery;
  discovery.polling_interval_ms =
      doc.get_int("discovery.polling_interval_ms", discovery.polling_interval_ms);
  discovery.steady_interval_ms = doc.get_int("discovery.steady_interval_ms", discovery.steady_interval_ms);
  discovery.poll_timeout_ms = doc.get_int("discovery.poll_timeout_ms", discovery.poll_timeout_ms);
  discovery.refresh_timeout_ms = doc.get_int("discovery.refresh_timeout_ms", discovery.refresh_timeout_ms);
  for (const auto &name : doc.get_string_array("discovery.disabled")) {
    discovery.disabled.push_back(common::to_lower(common::trim(name)));
  }

  config.android.adb_path =
      common::expand_path(doc.get_string("android.adb_path", config.android.adb_path));
  config.serial.extra_globs = doc.get_string_array("serial.extra_globs");
  config.log.verbose = doc.get_bool("log.verbose", config.log.verbose);

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (const char *device = std::getenv("LAUNCHPAD_DEVICE_ID"); device != nullptr && *device) {
    config.default_device_id = std::string(device);
  }
  if (const char *adb = std::getenv("LAUNCHPAD_ADB"); adb != nullptr && *adb) {
    config.android.adb_path = common::expand_path(adb);
  }
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto &path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto text = read_config_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure(text.error());
  }

  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &discovery = config.discovery;

  if (discovery.polling_interval_ms <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "discovery.polling_interval_ms must be positive");
  }
  if (discovery.steady_interval_ms <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "discovery.steady_interval_ms must be positive");
  }
  if (discovery.poll_timeout_ms <= 0) {
    return common::Result<std::vector<std::string>>::failure("discovery.poll_timeout_ms must be positive");
  }
  if (discovery.refresh_timeout_ms <= 0) {
    return common::Result<std::vector<std::string>>::failure(
        "discovery.refresh_timeout_ms must be positive");
  }

  const auto &known = known_backends();
  for (const auto &name : discovery.disabled) {
    if (std::find(known.begin(), known.end(), name) == known.end()) {
      return common::Result<std::vector<std::string>>::failure("Unknown backend in discovery.disabled: " +
                                                                name);
    }
  }
  if (std::all_of(known.begin(), known.end(),
                  [&config](const std::string &name) { return !is_backend_enabled(config, name); })) {
    warnings.push_back("every discovery backend is disabled; no devices will be found");
  }

  if (common::trim(config.android.adb_path).empty()) {
    return common::Result<std::vector<std::string>>::failure("android.adb_path must not be empty");
  }

  if (discovery.poll_timeout_ms > discovery.steady_interval_ms) {
    warnings.push_back("discovery.poll_timeout_ms is longer than discovery.steady_interval_ms");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

bool is_backend_enabled(const Config &config, const std::string &name) {
  const auto &disabled = config.discovery.disabled;
  return std::find(disabled.begin(), disabled.end(), name) == disabled.end();
}

discovery::PollingOptions polling_options(const Config &config) {
  discovery::PollingOptions options;
  options.polling_interval = async::Duration(config.discovery.polling_interval_ms);
  options.steady_interval = async::Duration(config.discovery.steady_interval_ms);
  options.poll_timeout = async::Duration(config.discovery.poll_timeout_ms);
  return options;
}

} // namespace launchpad::config
