#include "test_framework.hpp"

#include "launchpad/cli/commands.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto path =
      std::filesystem::temp_directory_path() / ("launchpad-cli-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

/// Config that only enables the in-process backends, so results do not depend on the host.
std::filesystem::path write_fixed_backends_config(const std::filesystem::path &home) {
  const auto path = home / "launchpad.toml";
  std::ofstream out(path);
  out << "[discovery]\n";
  out << "disabled = [\"android\", \"serial\"]\n";
  return path;
}

int run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  return launchpad::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

void register_cli_tests(std::vector<launchpad::tests::TestCase> &tests) {
  using launchpad::tests::require;

  tests.push_back({"cli_version_and_help", [] {
                     require(run_cli({"launchpad", "version"}) == 0, "version should succeed");
                     require(run_cli({"launchpad", "--help"}) == 0, "help should succeed");
                     require(run_cli({"launchpad"}) == 0, "no command prints help");
                   }});

  tests.push_back({"cli_unknown_command_fails", [] {
                     require(run_cli({"launchpad", "deploy"}) == 1, "unknown command should fail");
                     require(run_cli({"launchpad", "--config"}) == 1, "--config needs a value");
                   }});

  tests.push_back({"cli_devices_listing", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_config("LAUNCHPAD_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_device("LAUNCHPAD_DEVICE_ID", std::nullopt);
                     const auto config = write_fixed_backends_config(home);
                     require(run_cli({"launchpad", "--config", config.string(), "devices"}) == 0,
                             "devices should succeed");
                     require(run_cli({"launchpad", "--config=" + config.string(), "devices", "--machine"}) == 0,
                             "machine listing should succeed");
                     require(run_cli({"launchpad", "--config", config.string(), "devices", "--refresh",
                                      "--timeout", "500"}) == 0,
                             "refresh should succeed");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"cli_devices_rejects_bad_arguments", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_config("LAUNCHPAD_CONFIG_PATH", std::nullopt);
                     const auto config = write_fixed_backends_config(home);
                     require(run_cli({"launchpad", "--config", config.string(), "devices", "--timeout", "abc"}) == 1,
                             "non-numeric timeout rejected");
                     require(run_cli({"launchpad", "--config", config.string(), "devices", "--timeout", "0"}) == 1,
                             "zero timeout rejected");
                     require(run_cli({"launchpad", "--config", config.string(), "devices", "--wireless",
                                      "--attached"}) == 1,
                             "conflicting connection filters rejected");
                     require(run_cli({"launchpad", "--config", config.string(), "devices", "--bogus"}) == 1,
                             "unknown flag rejected");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"cli_select_by_id", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_config("LAUNCHPAD_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_device("LAUNCHPAD_DEVICE_ID", std::nullopt);
                     const auto config = write_fixed_backends_config(home);
                     require(run_cli({"launchpad", "--config", config.string(), "select", "-d", "web-server"}) == 0,
                             "well-known id selects");
                     require(run_cli({"launchpad", "--config", config.string(), "select", "-d", "WEB"}) == 0,
                             "case-insensitive prefix selects");
                     require(run_cli({"launchpad", "--config", config.string(), "select", "-d", "nosuch"}) == 1,
                             "no match exits 1");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"cli_select_uses_default_device_from_environment", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_config("LAUNCHPAD_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_device("LAUNCHPAD_DEVICE_ID", std::string("nosuch"));
                     const auto config = write_fixed_backends_config(home);
                     require(run_cli({"launchpad", "--config", config.string(), "select"}) == 1,
                             "environment default is used");
                     require(run_cli({"launchpad", "--config", config.string(), "select", "-d", "web-server"}) == 0,
                             "-d wins over the environment");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"cli_diagnostics_and_watch", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_config("LAUNCHPAD_CONFIG_PATH", std::nullopt);
                     const auto config = write_fixed_backends_config(home);
                     require(run_cli({"launchpad", "--config", config.string(), "diagnostics"}) == 0,
                             "diagnostics should succeed");
                     require(run_cli({"launchpad", "--config", config.string(), "watch", "--duration-secs", "0"}) == 1,
                             "watch needs a polling backend");
                     require(run_cli({"launchpad", "--config", config.string(), "watch", "--duration-secs", "x"}) == 1,
                             "bad duration rejected");
                     std::filesystem::remove_all(home);
                   }});

  tests.push_back({"cli_invalid_config_fails", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_config("LAUNCHPAD_CONFIG_PATH", std::nullopt);
                     const auto path = home / "bad.toml";
                     {
                       std::ofstream out(path);
                       out << "[discovery]\ndisabled = [\"ios\"]\n";
                     }
                     require(run_cli({"launchpad", "--config", path.string(), "devices"}) == 1,
                             "unknown backend in config fails");
                     std::filesystem::remove_all(home);
                   }});
}
