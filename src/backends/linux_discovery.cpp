#include "launchpad/backends/linux_discovery.hpp"

#include "launchpad/common/fs.hpp"

#include <sys/utsname.h>

namespace launchpad::backends {

device::TargetPlatform linux_target_for_machine(const std::string &machine) {
  const auto lower = common::to_lower(machine);
  if (lower == "aarch64" || lower == "arm64" || common::starts_with(lower, "armv8")) {
    return device::TargetPlatform::LinuxArm64;
  }
  return device::TargetPlatform::LinuxX64;
}

LinuxDevice::LinuxDevice()
    : device::Device(LINUX_DEVICE_ID, device::Category::Desktop, device::PlatformType::Linux, false),
      target_(device::TargetPlatform::LinuxX64), sdk_("Linux"),
      log_reader_(std::make_shared<device::NoOpDeviceLogReader>("linux")),
      port_forwarder_(std::make_shared<device::NoOpDevicePortForwarder>("linux")) {
  struct utsname info {};
  if (uname(&info) == 0) {
    target_ = linux_target_for_machine(info.machine);
    sdk_ = std::string(info.sysname) + " " + info.release;
  }
}

bool LinuxDevice::is_supported_for_project(const device::ProjectContext &project) const {
  return project.supports(device::PlatformType::Linux);
}

async::Future<device::TargetPlatform> LinuxDevice::target_platform() const {
  return device::known(target_);
}

async::Future<bool> LinuxDevice::is_local_emulator() const { return device::known(false); }

async::Future<std::string> LinuxDevice::sdk_name_and_version() const { return device::known(sdk_); }

async::Future<bool> LinuxDevice::supports_hardware_rendering() const {
  return device::known(true);
}

device::DeviceCapabilities LinuxDevice::capabilities() const {
  auto caps = device::default_capabilities();
  caps.screenshot = false;
  caps.fast_start = true;
  return caps;
}

std::shared_ptr<device::DeviceLogReader> LinuxDevice::log_reader() { return log_reader_; }

std::shared_ptr<device::DevicePortForwarder> LinuxDevice::port_forwarder() { return port_forwarder_; }

LinuxDiscovery::LinuxDiscovery() : device_(std::make_shared<LinuxDevice>()) {}

bool LinuxDiscovery::supports_platform() const {
#if defined(__linux__)
  return true;
#else
  return false;
#endif
}

device::DeviceList LinuxDiscovery::list_devices() { return {device_}; }

} // namespace launchpad::backends
