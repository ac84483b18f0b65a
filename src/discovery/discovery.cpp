#include "launchpad/discovery/discovery.hpp"

namespace launchpad::discovery {

async::Future<std::vector<std::string>> no_diagnostics() {
  return async::Future<std::vector<std::string>>::ready({});
}

async::Future<device::DeviceList> apply_filter(const device::DeviceList &devices,
                                               const std::optional<DiscoveryFilter> &filter) {
  if (!filter.has_value()) {
    return async::Future<device::DeviceList>::ready(devices);
  }
  return filter->filter_devices(devices);
}

async::Future<device::DeviceList>
FixedDeviceDiscovery::devices(const std::optional<DiscoveryFilter> &filter) {
  if (!supports_platform()) {
    return async::Future<device::DeviceList>::ready({});
  }
  return apply_filter(list_devices(), filter);
}

async::Future<device::DeviceList>
FixedDeviceDiscovery::discover_devices(const std::optional<async::Duration> timeout,
                                       const std::optional<DiscoveryFilter> &filter) {
  (void)timeout;
  return devices(filter);
}

} // namespace launchpad::discovery
