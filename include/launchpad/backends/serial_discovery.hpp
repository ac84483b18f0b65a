#pragma once

#include "launchpad/device/device.hpp"
#include "launchpad/discovery/polling.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace launchpad::backends {

[[nodiscard]] std::string guess_board_name(const std::string &device_path);

/// Stable short ID for a device node: "serial-" plus the first 12 hex digits of SHA-256(path).
[[nodiscard]] std::string serial_device_id(const std::string &device_path);

/// Serial device nodes under `dev_root`: the usual USB serial prefixes plus `extra_prefixes`,
/// and `serial/by-id` links. A by-id link hides the raw node it points at. Sorted.
[[nodiscard]] std::vector<std::string> list_serial_paths(const std::filesystem::path &dev_root,
                                                         const std::vector<std::string> &extra_prefixes);

/// Microcontroller board attached over a USB serial adapter. Runs the headless test target.
class SerialDevice final : public device::Device {
public:
  explicit SerialDevice(std::string path);

  [[nodiscard]] std::string name() const override;
  [[nodiscard]] bool is_connected() const override;
  [[nodiscard]] device::ConnectionInterface connection_interface() const override {
    return device::ConnectionInterface::Attached;
  }
  [[nodiscard]] bool is_supported() const override { return true; }
  [[nodiscard]] bool is_supported_for_project(const device::ProjectContext &project) const override {
    (void)project;
    return true;
  }

  [[nodiscard]] async::Future<device::TargetPlatform> target_platform() const override {
    return device::known(device::TargetPlatform::Tester);
  }
  [[nodiscard]] async::Future<bool> is_local_emulator() const override { return device::known(false); }
  [[nodiscard]] async::Future<std::string> sdk_name_and_version() const override {
    return device::known("serial " + board_);
  }
  [[nodiscard]] async::Future<bool> supports_hardware_rendering() const override {
    return device::known(false);
  }

  [[nodiscard]] device::DeviceCapabilities capabilities() const override;
  [[nodiscard]] std::shared_ptr<device::DeviceLogReader> log_reader() override { return log_reader_; }
  [[nodiscard]] std::shared_ptr<device::DevicePortForwarder> port_forwarder() override {
    return port_forwarder_;
  }

  [[nodiscard]] const std::string &path() const { return path_; }
  [[nodiscard]] const std::string &board() const { return board_; }

private:
  std::string path_;
  std::string board_;
  std::shared_ptr<device::DeviceLogReader> log_reader_;
  std::shared_ptr<device::DevicePortForwarder> port_forwarder_;
};

class SerialDiscovery final : public discovery::PollingDeviceDiscovery {
public:
  SerialDiscovery(async::EventLoop &loop, common::Logger &logger,
                  std::vector<std::string> extra_prefixes = {}, discovery::PollingOptions options = {},
                  std::filesystem::path dev_root = "/dev");

  [[nodiscard]] bool supports_platform() const override;
  [[nodiscard]] bool can_list_anything() const override { return supports_platform(); }
  [[nodiscard]] async::Future<std::vector<std::string>> diagnostics() override {
    return discovery::no_diagnostics();
  }
  [[nodiscard]] std::vector<std::string> well_known_ids() const override { return {}; }

protected:
  [[nodiscard]] async::Future<device::DeviceList>
  poll_devices(std::optional<async::Duration> timeout) override;

private:
  std::vector<std::string> extra_prefixes_;
  std::filesystem::path dev_root_;
};

} // namespace launchpad::backends
