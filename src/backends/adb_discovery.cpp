#include "launchpad/backends/adb_discovery.hpp"

#include "launchpad/common/fs.hpp"
#include "launchpad/common/process.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace launchpad::backends {

namespace {

constexpr const char *ADB_TLS_SUFFIX = "._adb-tls-connect._tcp";

std::string display_name(const AdbDeviceEntry &entry) {
  std::string name = !entry.model.empty() ? entry.model : entry.device;
  if (name.empty()) {
    return entry.serial;
  }
  std::replace(name.begin(), name.end(), '_', ' ');
  return name;
}

std::string property(const PropertyMap &props, const std::string &key) {
  const auto it = props.find(key);
  return it == props.end() ? std::string() : it->second;
}

} // namespace

AdbRunner make_process_adb_runner() {
  return [](const std::vector<std::string> &argv) -> common::Result<std::string> {
    auto output = common::run_capture(argv);
    if (!output.ok()) {
      return common::Result<std::string>::failure(output.error());
    }
    if (output.value().exit_code != 0) {
      return common::Result<std::string>::failure(
          "adb exited with status " + std::to_string(output.value().exit_code));
    }
    return common::Result<std::string>::success(std::move(output.value().stdout_text));
  };
}

AdbListing parse_adb_devices(const std::string &output) {
  AdbListing listing;
  std::istringstream stream(output);
  std::string raw;
  while (std::getline(stream, raw)) {
    const auto line = common::trim(raw);
    if (line.empty() || common::starts_with(line, "List of devices") || common::starts_with(line, "*")) {
      continue;
    }

    const auto tokens = common::split_whitespace(line);
    if (tokens.size() < 2) {
      listing.diagnostics.push_back("Unexpected output from adb: " + line);
      continue;
    }

    AdbDeviceEntry entry;
    entry.serial = tokens[0];
    entry.state = tokens[1];
    for (std::size_t i = 2; i < tokens.size(); ++i) {
      const auto colon = tokens[i].find(':');
      if (colon == std::string::npos) {
        continue;
      }
      const auto key = tokens[i].substr(0, colon);
      const auto value = tokens[i].substr(colon + 1);
      if (key == "model") {
        entry.model = value;
      } else if (key == "product") {
        entry.product = value;
      } else if (key == "device") {
        entry.device = value;
      }
    }

    if (entry.state == "device") {
      listing.devices.push_back(std::move(entry));
    } else if (entry.state == "offline") {
      listing.diagnostics.push_back("Device " + entry.serial + " is offline.");
      listing.devices.push_back(std::move(entry));
    } else if (entry.state == "unauthorized") {
      listing.diagnostics.push_back("Device " + entry.serial +
                                    " is not authorized. Allow USB debugging on the device.");
      listing.devices.push_back(std::move(entry));
    } else {
      listing.diagnostics.push_back("Unexpected failure from adb: " + line);
    }
  }
  return listing;
}

PropertyMap parse_getprop(const std::string &output) {
  PropertyMap props;
  std::istringstream stream(output);
  std::string raw;
  while (std::getline(stream, raw)) {
    const auto line = common::trim(raw);
    if (line.size() < 2 || line.front() != '[' || line.back() != ']') {
      continue;
    }
    const auto separator = line.find("]: [");
    if (separator == std::string::npos) {
      continue;
    }
    props[line.substr(1, separator - 1)] = line.substr(separator + 4, line.size() - separator - 5);
  }
  return props;
}

device::TargetPlatform android_target_for_abi(const std::string &abi) {
  if (abi == "arm64-v8a") {
    return device::TargetPlatform::AndroidArm64;
  }
  if (abi == "armeabi-v7a" || abi == "armeabi") {
    return device::TargetPlatform::AndroidArm;
  }
  if (abi == "x86_64") {
    return device::TargetPlatform::AndroidX64;
  }
  if (abi == "x86") {
    return device::TargetPlatform::AndroidX86;
  }
  return device::TargetPlatform::Android;
}

bool is_wireless_serial(const std::string &serial) {
  return serial.find(':') != std::string::npos || serial.find(ADB_TLS_SUFFIX) != std::string::npos;
}

bool is_emulator_serial(const std::string &serial) {
  constexpr std::string_view prefix = "emulator-";
  if (!common::starts_with(serial, prefix) || serial.size() == prefix.size()) {
    return false;
  }
  return std::all_of(serial.begin() + static_cast<std::ptrdiff_t>(prefix.size()), serial.end(),
                     [](const char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
}

AndroidDevice::AndroidDevice(async::EventLoop &loop, AdbRunner runner, std::string adb_path,
                             const AdbDeviceEntry &entry)
    : device::Device(entry.serial, device::Category::Mobile, device::PlatformType::Android, true),
      loop_(loop), runner_(std::move(runner)), adb_path_(std::move(adb_path)),
      name_(display_name(entry)), connected_(entry.state == "device"),
      log_reader_(std::make_shared<device::NoOpDeviceLogReader>(entry.serial)),
      port_forwarder_(std::make_shared<device::NoOpDevicePortForwarder>(entry.serial)) {}

device::ConnectionInterface AndroidDevice::connection_interface() const {
  return is_wireless_serial(id()) ? device::ConnectionInterface::Wireless
                                  : device::ConnectionInterface::Attached;
}

async::Future<PropertyMap> AndroidDevice::properties() const {
  if (properties_.valid()) {
    return properties_;
  }

  async::Promise<PropertyMap> promise;
  properties_ = promise.future();
  if (!connected_) {
    promise.resolve({});
    return properties_;
  }

  auto fetched = std::make_shared<PropertyMap>();
  const std::vector<std::string> argv = {adb_path_, "-s", id(), "shell", "getprop"};
  loop_.spawn_worker(
      [runner = runner_, argv, fetched]() {
        auto output = runner(argv);
        if (output.ok()) {
          *fetched = parse_getprop(output.value());
        }
      },
      [promise, fetched]() mutable { promise.resolve(std::move(*fetched)); });
  return properties_;
}

async::Future<device::TargetPlatform> AndroidDevice::target_platform() const {
  return async::map_result<device::TargetPlatform>(
      properties(), [](const common::Result<PropertyMap> &props) {
        const auto abi = props.ok() ? property(props.value(), "ro.product.cpu.abi") : std::string();
        return common::Result<device::TargetPlatform>::success(android_target_for_abi(abi));
      });
}

async::Future<bool> AndroidDevice::is_local_emulator() const {
  return device::known(is_emulator_serial(id()));
}

async::Future<std::string> AndroidDevice::sdk_name_and_version() const {
  return async::map_result<std::string>(properties(), [](const common::Result<PropertyMap> &props) {
    if (!props.ok()) {
      return common::Result<std::string>::success("Android");
    }
    const auto release = property(props.value(), "ro.build.version.release");
    const auto sdk = property(props.value(), "ro.build.version.sdk");
    if (release.empty()) {
      return common::Result<std::string>::success("Android");
    }
    std::string out = "Android " + release;
    if (!sdk.empty()) {
      out += " (API " + sdk + ")";
    }
    return common::Result<std::string>::success(std::move(out));
  });
}

async::Future<bool> AndroidDevice::supports_hardware_rendering() const {
  return async::map_result<bool>(properties(), [](const common::Result<PropertyMap> &props) {
    if (!props.ok()) {
      return common::Result<bool>::success(false);
    }
    const auto egl = property(props.value(), "ro.hardware.egl");
    return common::Result<bool>::success(!egl.empty() && egl.find("swiftshader") == std::string::npos);
  });
}

device::DeviceCapabilities AndroidDevice::capabilities() const {
  auto caps = device::default_capabilities();
  caps.screenshot = true;
  caps.fast_start = true;
  return caps;
}

AdbDiscovery::AdbDiscovery(async::EventLoop &loop, common::Logger &logger, std::string adb_path,
                           const discovery::PollingOptions options, AdbRunner runner,
                           std::function<bool(const std::string &)> tool_exists)
    : discovery::PollingDeviceDiscovery(loop, logger, "android", options),
      adb_path_(std::move(adb_path)),
      runner_(runner ? std::move(runner) : make_process_adb_runner()),
      tool_exists_(tool_exists ? std::move(tool_exists)
                               : [](const std::string &path) { return common::command_exists(path); }) {}

bool AdbDiscovery::can_list_anything() const { return tool_exists_(adb_path_); }

async::Future<device::DeviceList>
AdbDiscovery::poll_devices(const std::optional<async::Duration> timeout) {
  (void)timeout;
  if (!can_list_anything()) {
    *last_diagnostics_ = {};
    return async::Future<device::DeviceList>::ready({});
  }

  async::Promise<device::DeviceList> promise;
  auto output = std::make_shared<std::optional<common::Result<std::string>>>();
  const std::vector<std::string> argv = {adb_path_, "devices", "-l"};
  auto &event_loop = loop();
  loop().spawn_worker(
      [runner = runner_, argv, output]() { output->emplace(runner(argv)); },
      [promise, output, diagnostics = last_diagnostics_, &event_loop, runner = runner_,
       adb_path = adb_path_]() mutable {
        if (!output->has_value() || !(*output)->ok()) {
          promise.reject(output->has_value() ? (*output)->error() : "adb produced no result");
          return;
        }
        auto listing = parse_adb_devices((*output)->value());
        *diagnostics = std::move(listing.diagnostics);
        device::DeviceList devices;
        devices.reserve(listing.devices.size());
        for (const auto &entry : listing.devices) {
          devices.push_back(std::make_shared<AndroidDevice>(event_loop, runner, adb_path, entry));
        }
        promise.resolve(std::move(devices));
      });
  return promise.future();
}

async::Future<std::vector<std::string>> AdbDiscovery::diagnostics() {
  if (!can_list_anything()) {
    return async::Future<std::vector<std::string>>::ready(
        {"Unable to locate adb at '" + adb_path_ +
         "'. Install the Android SDK platform-tools or set android.adb_path."});
  }
  return async::map_result<std::vector<std::string>>(
      devices(std::nullopt),
      [diagnostics = last_diagnostics_](const common::Result<device::DeviceList> &listed) {
        if (!listed.ok()) {
          return common::Result<std::vector<std::string>>::success({"Unable to run adb: " + listed.error()});
        }
        return common::Result<std::vector<std::string>>::success(*diagnostics);
      });
}

} // namespace launchpad::backends
