#include "launchpad/discovery/filter.hpp"

#include <utility>
#include <vector>

namespace launchpad::discovery {

SupportFilter::SupportFilter(std::shared_ptr<const device::ProjectContext> project,
                             const bool exclude_by_project, const bool exclude_by_all)
    : project_(std::move(project)), exclude_by_project_(exclude_by_project),
      exclude_by_all_(exclude_by_all) {}

SupportFilter SupportFilter::exclude_devices_unsupported_by_tool() {
  return SupportFilter(nullptr, false, false);
}

SupportFilter SupportFilter::exclude_devices_unsupported_by_tool_or_project(
    std::shared_ptr<const device::ProjectContext> project) {
  return SupportFilter(std::move(project), true, false);
}

SupportFilter SupportFilter::exclude_devices_unsupported_by_tool_or_project_or_all(
    std::shared_ptr<const device::ProjectContext> project) {
  return SupportFilter(std::move(project), true, true);
}

async::Future<bool> SupportFilter::matches(const device::DevicePtr &device) const {
  if (!device->is_supported()) {
    return async::Future<bool>::ready(false);
  }
  if (exclude_by_project_ && !is_supported_for_project(*device)) {
    return async::Future<bool>::ready(false);
  }
  if (!exclude_by_all_) {
    return async::Future<bool>::ready(true);
  }
  return is_supported_for_all(device);
}

async::Future<bool> SupportFilter::is_supported_for_all(const device::DevicePtr &device) const {
  if (!device->is_supported() || !is_supported_for_project(*device)) {
    return async::Future<bool>::ready(false);
  }
  return async::map_result<bool>(
      device->target_platform(), [](const common::Result<device::TargetPlatform> &platform) {
        if (!platform.ok()) {
          return common::Result<bool>::failure(platform.error());
        }
        return common::Result<bool>::success(!device::is_excluded_from_all(platform.value()));
      });
}

bool SupportFilter::is_supported_for_project(const device::Device &device) const {
  if (!device.is_supported()) {
    return false;
  }
  if (project_ == nullptr) {
    return true;
  }
  return device.is_supported_for_project(*project_);
}

DiscoveryFilter::DiscoveryFilter(const bool exclude_disconnected,
                                 std::optional<SupportFilter> support_filter,
                                 const std::optional<device::ConnectionInterface> connection_interface)
    : exclude_disconnected_(exclude_disconnected), support_filter_(std::move(support_filter)),
      connection_interface_(connection_interface) {}

async::Future<bool> DiscoveryFilter::matches(const device::DevicePtr &device) const {
  const bool meets_connection = !exclude_disconnected_ || device->is_connected();
  const bool meets_interface = matches_connection_interface(*device, connection_interface_);
  if (!meets_connection || !meets_interface) {
    return async::Future<bool>::ready(false);
  }
  if (!support_filter_.has_value()) {
    return async::Future<bool>::ready(true);
  }
  return support_filter_->matches(device);
}

async::Future<device::DeviceList>
DiscoveryFilter::filter_devices(const device::DeviceList &devices) const {
  std::vector<async::Future<bool>> checks;
  checks.reserve(devices.size());
  for (const auto &device : devices) {
    checks.push_back(matches(device));
  }

  return async::map_result<device::DeviceList>(
      async::when_all(checks),
      [devices](const common::Result<std::vector<common::Result<bool>>> &settled) {
        device::DeviceList kept;
        if (!settled.ok()) {
          return common::Result<device::DeviceList>::failure(settled.error());
        }
        const auto &verdicts = settled.value();
        for (std::size_t i = 0; i < devices.size(); ++i) {
          // A device whose platform cannot be resolved is not eligible.
          if (verdicts[i].ok() && verdicts[i].value()) {
            kept.push_back(devices[i]);
          }
        }
        return common::Result<device::DeviceList>::success(std::move(kept));
      });
}

bool DiscoveryFilter::matches_connection_interface(
    const device::Device &device, const std::optional<device::ConnectionInterface> connection_interface) {
  if (!connection_interface.has_value()) {
    return true;
  }
  return device.connection_interface() == *connection_interface;
}

} // namespace launchpad::discovery
