#pragma once

#include "launchpad/async/future.hpp"
#include "launchpad/device/device.hpp"
#include "launchpad/discovery/filter.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace launchpad::discovery {

/// One platform-specific source of devices (adb, the host desktop, attached boards, ...).
class DeviceDiscovery {
public:
  virtual ~DeviceDiscovery() = default;

  [[nodiscard]] virtual std::string name() const = 0;

  /// Whether this backend can produce anything on the current host. Backends that cannot are
  /// left out of every aggregate query.
  [[nodiscard]] virtual bool supports_platform() const = 0;

  /// Whether listing is currently possible (e.g. the external tool it needs is installed).
  [[nodiscard]] virtual bool can_list_anything() const = 0;

  [[nodiscard]] virtual async::Future<device::DeviceList>
  devices(const std::optional<DiscoveryFilter> &filter) = 0;

  [[nodiscard]] virtual async::Future<device::DeviceList>
  discover_devices(std::optional<async::Duration> timeout,
                   const std::optional<DiscoveryFilter> &filter) = 0;

  [[nodiscard]] virtual async::Future<std::vector<std::string>> diagnostics() = 0;

  /// IDs this backend can resolve without enumerating, e.g. "linux".
  [[nodiscard]] virtual std::vector<std::string> well_known_ids() const = 0;
};

using DiscoveryPtr = std::shared_ptr<DeviceDiscovery>;

[[nodiscard]] async::Future<std::vector<std::string>> no_diagnostics();

[[nodiscard]] async::Future<device::DeviceList> apply_filter(const device::DeviceList &devices,
                                                             const std::optional<DiscoveryFilter> &filter);

class FixedDeviceDiscovery : public DeviceDiscovery {
public:
  [[nodiscard]] async::Future<device::DeviceList>
  devices(const std::optional<DiscoveryFilter> &filter) override;

  [[nodiscard]] async::Future<device::DeviceList>
  discover_devices(std::optional<async::Duration> timeout,
                   const std::optional<DiscoveryFilter> &filter) override;

protected:
  [[nodiscard]] virtual device::DeviceList list_devices() = 0;
};

} // namespace launchpad::discovery
