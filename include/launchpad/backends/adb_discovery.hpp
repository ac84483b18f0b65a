#pragma once

#include "launchpad/async/event_loop.hpp"
#include "launchpad/common/result.hpp"
#include "launchpad/device/device.hpp"
#include "launchpad/discovery/polling.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace launchpad::backends {

/// Runs an adb invocation to completion and returns its standard output. Called on a worker
/// thread.
using AdbRunner = std::function<common::Result<std::string>(const std::vector<std::string> &argv)>;

[[nodiscard]] AdbRunner make_process_adb_runner();

struct AdbDeviceEntry {
  std::string serial;
  std::string state;
  std::string model;
  std::string product;
  std::string device;
};

struct AdbListing {
  std::vector<AdbDeviceEntry> devices;
  std::vector<std::string> diagnostics;
};

/// Parse `adb devices -l`. Offline and unauthorized devices are kept and reported in the
/// diagnostics; lines in any other state are reported and dropped.
[[nodiscard]] AdbListing parse_adb_devices(const std::string &output);

[[nodiscard]] std::map<std::string, std::string> parse_getprop(const std::string &output);

[[nodiscard]] device::TargetPlatform android_target_for_abi(const std::string &abi);

[[nodiscard]] bool is_wireless_serial(const std::string &serial);
[[nodiscard]] bool is_emulator_serial(const std::string &serial);

using PropertyMap = std::map<std::string, std::string>;

class AndroidDevice final : public device::Device {
public:
  AndroidDevice(async::EventLoop &loop, AdbRunner runner, std::string adb_path,
                const AdbDeviceEntry &entry);

  [[nodiscard]] std::string name() const override { return name_; }
  [[nodiscard]] bool is_connected() const override { return connected_; }
  [[nodiscard]] device::ConnectionInterface connection_interface() const override;
  [[nodiscard]] bool is_supported() const override { return true; }
  [[nodiscard]] bool is_supported_for_project(const device::ProjectContext &project) const override {
    return project.supports(device::PlatformType::Android);
  }

  [[nodiscard]] async::Future<device::TargetPlatform> target_platform() const override;
  [[nodiscard]] async::Future<bool> is_local_emulator() const override;
  [[nodiscard]] async::Future<std::string> sdk_name_and_version() const override;
  [[nodiscard]] async::Future<bool> supports_hardware_rendering() const override;

  [[nodiscard]] device::DeviceCapabilities capabilities() const override;
  [[nodiscard]] std::shared_ptr<device::DeviceLogReader> log_reader() override { return log_reader_; }
  [[nodiscard]] std::shared_ptr<device::DevicePortForwarder> port_forwarder() override {
    return port_forwarder_;
  }

private:
  /// Device properties, fetched once on first use. Empty when the device cannot be queried.
  [[nodiscard]] async::Future<PropertyMap> properties() const;

  async::EventLoop &loop_;
  AdbRunner runner_;
  std::string adb_path_;
  std::string name_;
  bool connected_ = false;
  std::shared_ptr<device::DeviceLogReader> log_reader_;
  std::shared_ptr<device::DevicePortForwarder> port_forwarder_;
  mutable async::Future<PropertyMap> properties_;
};

class AdbDiscovery final : public discovery::PollingDeviceDiscovery {
public:
  AdbDiscovery(async::EventLoop &loop, common::Logger &logger, std::string adb_path,
               discovery::PollingOptions options = {}, AdbRunner runner = nullptr,
               std::function<bool(const std::string &)> tool_exists = nullptr);

  [[nodiscard]] bool supports_platform() const override { return true; }
  [[nodiscard]] bool can_list_anything() const override;
  [[nodiscard]] async::Future<std::vector<std::string>> diagnostics() override;
  [[nodiscard]] std::vector<std::string> well_known_ids() const override { return {}; }

protected:
  [[nodiscard]] async::Future<device::DeviceList>
  poll_devices(std::optional<async::Duration> timeout) override;

private:
  std::string adb_path_;
  AdbRunner runner_;
  std::function<bool(const std::string &)> tool_exists_;
  // Shared with in-flight worker completions.
  std::shared_ptr<std::vector<std::string>> last_diagnostics_ =
      std::make_shared<std::vector<std::string>>();
};

} // namespace launchpad::backends
