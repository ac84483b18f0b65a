#include "launchpad/cli/commands.hpp"

#include "launchpad/async/event_loop.hpp"
#include "launchpad/async/future.hpp"
#include "launchpad/backends/adb_discovery.hpp"
#include "launchpad/backends/linux_discovery.hpp"
#include "launchpad/backends/serial_discovery.hpp"
#include "launchpad/backends/web_server_discovery.hpp"
#include "launchpad/common/fs.hpp"
#include "launchpad/common/logger.hpp"
#include "launchpad/config/config.hpp"
#include "launchpad/device/project.hpp"
#include "launchpad/device/summary.hpp"
#include "launchpad/discovery/manager.hpp"
#include "launchpad/discovery/polling.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace launchpad::cli {

namespace {

constexpr int EXIT_NO_MATCH = 1;
constexpr int EXIT_AMBIGUOUS = 2;

std::string version_string() {
#ifdef LAUNCHPAD_VERSION
  std::string version = LAUNCHPAD_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "launchpad " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, bool &verbose, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    if (args[i] == "-v" || args[i] == "--verbose") {
      verbose = true;
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args) { return common::join(args, " "); }

std::optional<std::int64_t> parse_non_negative(const std::string &text) {
  std::int64_t value = 0;
  const auto *begin = text.data();
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || value < 0) {
    return std::nullopt;
  }
  return value;
}

/// Everything one command needs: the loop, the configured backends and the manager over them.
struct Session {
  async::EventLoop loop;
  common::StderrLogger logger;
  config::Config config;
  std::vector<discovery::DiscoveryPtr> backends;
  std::vector<std::shared_ptr<discovery::PollingDeviceDiscovery>> polling;
  std::unique_ptr<discovery::DeviceManager> manager;
};

common::Result<std::unique_ptr<Session>> open_session(const bool verbose) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::unique_ptr<Session>>::failure(loaded.error());
  }
  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<Session>>::failure("invalid config: " + validated.error());
  }

  auto session = std::make_unique<Session>();
  session->config = std::move(loaded.value());
  session->logger.set_verbose(verbose || session->config.log.verbose);
  for (const auto &warning : validated.value()) {
    session->logger.error("warning: " + warning);
  }

  const auto &cfg = session->config;
  const auto options = config::polling_options(cfg);
  if (config::is_backend_enabled(cfg, "linux")) {
    session->backends.push_back(std::make_shared<backends::LinuxDiscovery>());
  }
  if (config::is_backend_enabled(cfg, "web-server")) {
    session->backends.push_back(std::make_shared<backends::WebServerDiscovery>());
  }
  if (config::is_backend_enabled(cfg, "android")) {
    auto adb = std::make_shared<backends::AdbDiscovery>(session->loop, session->logger,
                                                        cfg.android.adb_path, options);
    session->polling.push_back(adb);
    session->backends.push_back(adb);
  }
  if (config::is_backend_enabled(cfg, "serial")) {
    auto serial = std::make_shared<backends::SerialDiscovery>(session->loop, session->logger,
                                                              cfg.serial.extra_globs, options);
    session->polling.push_back(serial);
    session->backends.push_back(serial);
  }

  session->manager = std::make_unique<discovery::DeviceManager>(
      session->logger, session->backends, [] { return device::ProjectContext::current(); });
  session->manager->set_specified_device_id(cfg.default_device_id);
  return common::Result<std::unique_ptr<Session>>::success(std::move(session));
}

common::Result<std::vector<device::DeviceSummary>> summarize_devices(Session &session,
                                                                     const device::DeviceList &devices) {
  return async::wait(session.loop, device::summarize_all(devices));
}

void print_table(const std::vector<device::DeviceSummary> &summaries) {
  for (const auto &line : device::descriptions(summaries)) {
    std::cout << line << "\n";
  }
}

int run_devices(std::vector<std::string> args, const bool verbose) {
  std::string device_id;
  const bool has_device_id = take_option(args, "--device-id", "-d", device_id);
  std::string timeout_text;
  const bool has_timeout = take_option(args, "--timeout", "", timeout_text);
  const bool machine = take_flag(args, "--machine");
  const bool refresh = take_flag(args, "--refresh");
  const bool wireless = take_flag(args, "--wireless");
  const bool attached = take_flag(args, "--attached");
  const bool include_unsupported = take_flag(args, "--include-unsupported");

  if (!args.empty()) {
    std::cerr << "unknown devices arguments: " << join_tokens(args) << "\n";
    std::cerr << "usage: launchpad devices [-d <id>] [--machine] [--refresh] [--timeout <ms>] "
                 "[--wireless|--attached] [--include-unsupported]\n";
    return 1;
  }
  if (wireless && attached) {
    std::cerr << "--wireless and --attached cannot be combined\n";
    return 1;
  }
  std::optional<std::int64_t> timeout_ms;
  if (has_timeout) {
    timeout_ms = parse_non_negative(timeout_text);
    if (!timeout_ms.has_value() || *timeout_ms == 0) {
      std::cerr << "--timeout expects a positive number of milliseconds\n";
      return 1;
    }
  }

  auto opened = open_session(verbose);
  if (!opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto &session = *opened.value();
  auto &manager = *session.manager;
  if (has_device_id) {
    manager.set_specified_device_id(device_id);
  }

  std::optional<device::ConnectionInterface> connection;
  if (wireless) {
    connection = device::ConnectionInterface::Wireless;
  } else if (attached) {
    connection = device::ConnectionInterface::Attached;
  }
  const discovery::DiscoveryFilter filter(true, manager.device_support_filter(include_unsupported),
                                          connection);

  if (refresh || has_timeout) {
    const auto timeout =
        async::Duration(timeout_ms.value_or(session.config.discovery.refresh_timeout_ms));
    const auto refreshed = async::wait(session.loop, manager.refresh_all_devices(timeout, filter));
    if (!refreshed.ok()) {
      session.logger.trace("refresh failed: " + refreshed.error());
    }
  }

  const auto devices = async::wait(session.loop, manager.get_devices(filter));
  if (!devices.ok()) {
    std::cerr << devices.error() << "\n";
    return 1;
  }
  const auto summaries = summarize_devices(session, devices.value());
  if (!summaries.ok()) {
    std::cerr << summaries.error() << "\n";
    return 1;
  }

  if (machine) {
    std::cout << device::to_json(summaries.value()) << "\n";
    return 0;
  }
  if (summaries.value().empty()) {
    std::cout << "No devices found.\n";
    if (!manager.can_list_anything()) {
      std::cout << "Run 'launchpad diagnostics' for setup problems.\n";
    }
    return 0;
  }
  std::cout << summaries.value().size() << " connected device"
            << (summaries.value().size() == 1 ? "" : "s") << ":\n\n";
  print_table(summaries.value());
  return 0;
}

int run_select(std::vector<std::string> args, const bool verbose) {
  std::string device_id;
  const bool has_device_id = take_option(args, "--device-id", "-d", device_id);
  const bool machine = take_flag(args, "--machine");
  if (!args.empty()) {
    std::cerr << "usage: launchpad select [-d <id>] [--machine]\n";
    return 1;
  }

  auto opened = open_session(verbose);
  if (!opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto &session = *opened.value();
  auto &manager = *session.manager;
  if (has_device_id) {
    manager.set_specified_device_id(device_id);
  }

  const discovery::DiscoveryFilter filter(true, manager.device_support_filter());
  const auto found = async::wait(session.loop, manager.get_devices(filter));
  if (!found.ok()) {
    std::cerr << found.error() << "\n";
    return 1;
  }

  device::DeviceList chosen = found.value();
  if (chosen.empty()) {
    if (const auto id = manager.specified_device_id(); id.has_value()) {
      std::cerr << "No supported devices found with name or id matching '" << *id << "'.\n";
    } else {
      std::cerr << "No supported devices connected.\n";
    }
    return EXIT_NO_MATCH;
  }
  if (chosen.size() > 1 && !manager.has_specified_all_devices()) {
    if (auto single = manager.get_single_ephemeral_device(chosen)) {
      chosen = {single};
    }
  }

  const auto summaries = summarize_devices(session, chosen);
  if (!summaries.ok()) {
    std::cerr << summaries.error() << "\n";
    return 1;
  }

  if (chosen.size() > 1 && !manager.has_specified_all_devices()) {
    if (const auto id = manager.specified_device_id(); id.has_value()) {
      std::cerr << "Found " << chosen.size() << " devices with name or id matching '" << *id << "':\n";
    } else {
      std::cerr << "More than one device connected; please specify a device with -d <id>, or use "
                   "'-d all' to act on all devices.\n";
    }
    for (const auto &line : device::descriptions(summaries.value())) {
      std::cerr << line << "\n";
    }
    return EXIT_AMBIGUOUS;
  }

  if (machine) {
    std::cout << device::to_json(summaries.value()) << "\n";
  } else {
    print_table(summaries.value());
  }
  return 0;
}

int run_diagnostics(std::vector<std::string> args, const bool verbose) {
  if (!args.empty()) {
    std::cerr << "usage: launchpad diagnostics\n";
    return 1;
  }
  auto opened = open_session(verbose);
  if (!opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto &session = *opened.value();

  const auto diagnostics = async::wait(session.loop, session.manager->get_device_diagnostics());
  if (!diagnostics.ok()) {
    std::cerr << diagnostics.error() << "\n";
    return 1;
  }
  if (diagnostics.value().empty()) {
    std::cout << "No issues found.\n";
    return 0;
  }
  for (const auto &line : diagnostics.value()) {
    std::cout << "• " << line << "\n";
  }
  return 0;
}

int run_watch(std::vector<std::string> args, const bool verbose) {
  std::string duration_text = "30";
  (void)take_option(args, "--duration-secs", "", duration_text);
  if (!args.empty()) {
    std::cerr << "usage: launchpad watch [--duration-secs N]\n";
    return 1;
  }
  const auto seconds = parse_non_negative(duration_text);
  if (!seconds.has_value()) {
    std::cerr << "--duration-secs expects a non-negative number\n";
    return 1;
  }

  auto opened = open_session(verbose);
  if (!opened.ok()) {
    std::cerr << opened.error() << "\n";
    return 1;
  }
  auto &session = *opened.value();

  if (session.polling.empty()) {
    std::cerr << "No polling backends are enabled.\n";
    return 1;
  }
  for (const auto &backend : session.polling) {
    backend->on_added([](const device::DevicePtr &device) {
      std::cout << "+ " << device->id() << " (" << device->name() << ")" << std::endl;
    });
    backend->on_removed(
        [](const device::DevicePtr &device) { std::cout << "- " << device->id() << std::endl; });
    backend->start_polling();
  }

  session.loop.run_for(std::chrono::duration_cast<async::Duration>(std::chrono::seconds(*seconds)));

  for (const auto &backend : session.polling) {
    backend->dispose();
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: launchpad [--config PATH] [-v|--verbose] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  devices       List attached devices\n";
  std::cout << "                  -d <id>  --machine  --refresh  --timeout <ms>\n";
  std::cout << "                  --wireless | --attached  --include-unsupported\n";
  std::cout << "  select        Resolve the device(s) a run would target (-d <id>|all)\n";
  std::cout << "  diagnostics   Report problems that keep devices from being listed\n";
  std::cout << "  watch         Print devices as they appear (+) and disappear (-)\n";
  std::cout << "                  --duration-secs N\n";
  std::cout << "  version       Show version\n";
  std::cout << "  help          Show this message\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  config::clear_config_path_override();
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  bool verbose = false;
  std::string global_error;
  if (!apply_global_options(args, verbose, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = common::to_lower(common::trim(args[0]));
  args.erase(args.begin());

  if (subcommand == "devices") {
    return run_devices(std::move(args), verbose);
  }
  if (subcommand == "select") {
    return run_select(std::move(args), verbose);
  }
  if (subcommand == "diagnostics") {
    return run_diagnostics(std::move(args), verbose);
  }
  if (subcommand == "watch") {
    return run_watch(std::move(args), verbose);
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_help();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace launchpad::cli
