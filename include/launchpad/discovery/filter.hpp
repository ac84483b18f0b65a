#pragma once

#include "launchpad/async/future.hpp"
#include "launchpad/device/device.hpp"

#include <memory>
#include <optional>

namespace launchpad::discovery {

/// Decides whether a device is supported, by the tool and optionally by the current project
/// and by the "all devices" selection.
class SupportFilter {
public:
  [[nodiscard]] static SupportFilter exclude_devices_unsupported_by_tool();

  /// Devices supported by the tool and by `project`. A null project counts every supported
  /// device as supported by the project.
  [[nodiscard]] static SupportFilter
  exclude_devices_unsupported_by_tool_or_project(std::shared_ptr<const device::ProjectContext> project);

  [[nodiscard]] static SupportFilter exclude_devices_unsupported_by_tool_or_project_or_all(
      std::shared_ptr<const device::ProjectContext> project);

  [[nodiscard]] async::Future<bool> matches(const device::DevicePtr &device) const;

  /// "all" runs every selected device through one shared execution pipeline, which web and
  /// fuchsia targets cannot join.
  [[nodiscard]] async::Future<bool> is_supported_for_all(const device::DevicePtr &device) const;

  [[nodiscard]] bool is_supported_for_project(const device::Device &device) const;

  [[nodiscard]] bool excludes_unsupported_by_project() const { return exclude_by_project_; }
  [[nodiscard]] bool excludes_unsupported_by_all() const { return exclude_by_all_; }
  [[nodiscard]] const std::shared_ptr<const device::ProjectContext> &project() const {
    return project_;
  }

private:
  SupportFilter(std::shared_ptr<const device::ProjectContext> project, bool exclude_by_project,
                bool exclude_by_all);

  std::shared_ptr<const device::ProjectContext> project_;
  bool exclude_by_project_ = false;
  bool exclude_by_all_ = false;
};

class DiscoveryFilter {
public:
  explicit DiscoveryFilter(bool exclude_disconnected = true,
                           std::optional<SupportFilter> support_filter = std::nullopt,
                           std::optional<device::ConnectionInterface> connection_interface =
                               std::nullopt);

  [[nodiscard]] async::Future<bool> matches(const device::DevicePtr &device) const;

  [[nodiscard]] async::Future<device::DeviceList> filter_devices(const device::DeviceList &devices) const;

  [[nodiscard]] static bool
  matches_connection_interface(const device::Device &device,
                               std::optional<device::ConnectionInterface> connection_interface);

  [[nodiscard]] bool exclude_disconnected() const { return exclude_disconnected_; }
  [[nodiscard]] const std::optional<SupportFilter> &support_filter() const { return support_filter_; }
  [[nodiscard]] std::optional<device::ConnectionInterface> connection_interface() const {
    return connection_interface_;
  }

private:
  bool exclude_disconnected_ = true;
  std::optional<SupportFilter> support_filter_;
  std::optional<device::ConnectionInterface> connection_interface_;
};

} // namespace launchpad::discovery
