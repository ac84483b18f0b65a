#include "launchpad/device/device.hpp"

#include <functional>
#include <set>
#include <utility>

namespace launchpad::device {

Device::Device(std::string id, const std::optional<Category> category,
               const std::optional<PlatformType> platform_type, const bool ephemeral)
    : id_(std::move(id)), category_(category), platform_type_(platform_type),
      ephemeral_(ephemeral) {}

void Device::dispose() {
  if (const auto reader = log_reader()) {
    reader->dispose();
  }
  if (const auto forwarder = port_forwarder()) {
    forwarder->dispose();
  }
}

std::size_t DeviceIdHash::operator()(const DevicePtr &device) const {
  return std::hash<std::string>{}(device->id());
}

DeviceCapabilities default_capabilities() { return DeviceCapabilities{}; }

std::string support_message(const Device &device) {
  return device.is_supported() ? "Supported" : "Unsupported";
}

std::vector<std::string> platform_types(const DeviceList &devices) {
  std::set<std::string> names;
  for (const auto &device : devices) {
    const auto platform = device->platform_type();
    names.insert(platform.has_value() ? to_string(*platform) : "null");
  }
  return {names.begin(), names.end()};
}

} // namespace launchpad::device
