#pragma once

#include "launchpad/device/device.hpp"
#include "launchpad/discovery/discovery.hpp"

#include <memory>
#include <string>
#include <vector>

namespace launchpad::backends {

constexpr const char *WEB_SERVER_DEVICE_ID = "web-server";

/// Serves the application over HTTP for any browser to open.
class WebServerDevice final : public device::Device {
public:
  WebServerDevice();

  [[nodiscard]] std::string name() const override { return "Web Server"; }
  [[nodiscard]] bool is_connected() const override { return true; }
  [[nodiscard]] device::ConnectionInterface connection_interface() const override {
    return device::ConnectionInterface::Attached;
  }
  [[nodiscard]] bool is_supported() const override { return true; }
  [[nodiscard]] bool is_supported_for_project(const device::ProjectContext &project) const override {
    return project.supports(device::PlatformType::Web);
  }

  [[nodiscard]] async::Future<device::TargetPlatform> target_platform() const override {
    return device::known(device::TargetPlatform::WebJavascript);
  }
  [[nodiscard]] async::Future<bool> is_local_emulator() const override { return device::known(false); }
  [[nodiscard]] async::Future<std::string> sdk_name_and_version() const override {
    return device::known(std::string("Web Server"));
  }
  [[nodiscard]] async::Future<bool> supports_hardware_rendering() const override {
    return device::known(false);
  }

  [[nodiscard]] device::DeviceCapabilities capabilities() const override;
  [[nodiscard]] std::shared_ptr<device::DeviceLogReader> log_reader() override { return log_reader_; }
  [[nodiscard]] std::shared_ptr<device::DevicePortForwarder> port_forwarder() override {
    return port_forwarder_;
  }

private:
  std::shared_ptr<device::DeviceLogReader> log_reader_;
  std::shared_ptr<device::DevicePortForwarder> port_forwarder_;
};

class WebServerDiscovery final : public discovery::FixedDeviceDiscovery {
public:
  WebServerDiscovery();

  [[nodiscard]] std::string name() const override { return "web-server"; }
  [[nodiscard]] bool supports_platform() const override { return true; }
  [[nodiscard]] bool can_list_anything() const override { return true; }
  [[nodiscard]] async::Future<std::vector<std::string>> diagnostics() override {
    return discovery::no_diagnostics();
  }
  [[nodiscard]] std::vector<std::string> well_known_ids() const override {
    return {WEB_SERVER_DEVICE_ID};
  }

protected:
  [[nodiscard]] device::DeviceList list_devices() override { return {device_}; }

private:
  device::DevicePtr device_;
};

} // namespace launchpad::backends
