#pragma once

#include "launchpad/device/device.hpp"
#include "launchpad/discovery/discovery.hpp"

#include <memory>
#include <string>
#include <vector>

namespace launchpad::backends {

constexpr const char *LINUX_DEVICE_ID = "linux";

class LinuxDevice final : public device::Device {
public:
  LinuxDevice();

  [[nodiscard]] std::string name() const override { return "Linux"; }
  [[nodiscard]] bool is_connected() const override { return true; }
  [[nodiscard]] device::ConnectionInterface connection_interface() const override {
    return device::ConnectionInterface::Attached;
  }
  [[nodiscard]] bool is_supported() const override { return true; }
  [[nodiscard]] bool is_supported_for_project(const device::ProjectContext &project) const override;

  [[nodiscard]] async::Future<device::TargetPlatform> target_platform() const override;
  [[nodiscard]] async::Future<bool> is_local_emulator() const override;
  [[nodiscard]] async::Future<std::string> sdk_name_and_version() const override;
  [[nodiscard]] async::Future<bool> supports_hardware_rendering() const override;

  [[nodiscard]] device::DeviceCapabilities capabilities() const override;
  [[nodiscard]] std::shared_ptr<device::DeviceLogReader> log_reader() override;
  [[nodiscard]] std::shared_ptr<device::DevicePortForwarder> port_forwarder() override;

private:
  device::TargetPlatform target_;
  std::string sdk_;
  std::shared_ptr<device::DeviceLogReader> log_reader_;
  std::shared_ptr<device::DevicePortForwarder> port_forwarder_;
};

[[nodiscard]] device::TargetPlatform linux_target_for_machine(const std::string &machine);

class LinuxDiscovery final : public discovery::FixedDeviceDiscovery {
public:
  LinuxDiscovery();

  [[nodiscard]] std::string name() const override { return "linux"; }
  [[nodiscard]] bool supports_platform() const override;
  [[nodiscard]] bool can_list_anything() const override { return supports_platform(); }
  [[nodiscard]] async::Future<std::vector<std::string>> diagnostics() override {
    return discovery::no_diagnostics();
  }
  [[nodiscard]] std::vector<std::string> well_known_ids() const override { return {LINUX_DEVICE_ID}; }

protected:
  [[nodiscard]] device::DeviceList list_devices() override;

private:
  device::DevicePtr device_;
};

} // namespace launchpad::backends
