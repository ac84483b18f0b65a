#pragma once

#include "launchpad/async/future.hpp"
#include "launchpad/common/logger.hpp"
#include "launchpad/discovery/discovery.hpp"
#include "launchpad/discovery/filter.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace launchpad::discovery {

constexpr const char *ALL_DEVICES = "all";

using ProjectProvider = std::function<std::shared_ptr<const device::ProjectContext>()>;

/// Aggregates the registered backends and resolves what the user asked to run on.
///
/// Built once by the command layer (or a test) and passed around explicitly. Backends that do
/// not support the host platform are ignored by every operation.
class DeviceManager {
public:
  DeviceManager(common::Logger &logger, std::vector<DiscoveryPtr> backends,
                ProjectProvider project_provider = nullptr);

  void set_specified_device_id(std::optional<std::string> id) { specified_ = std::move(id); }

  [[nodiscard]] std::optional<std::string> specified_device_id() const;
  [[nodiscard]] bool has_specified_device_id() const { return specified_device_id().has_value(); }
  [[nodiscard]] bool has_specified_all_devices() const;

  [[nodiscard]] async::Future<device::DeviceList>
  get_all_devices(std::optional<DiscoveryFilter> filter = std::nullopt);

  [[nodiscard]] async::Future<device::DeviceList>
  refresh_all_devices(std::optional<async::Duration> timeout = std::nullopt,
                      std::optional<DiscoveryFilter> filter = std::nullopt);

  /// Devices whose ID or name equals `id` (case-insensitively) or starts with it.
  ///
  /// The first exact match from any backend wins immediately, without waiting for slower
  /// backends. Otherwise every prefix match is returned once all backends have answered, in
  /// backend registration order. Every backend is asked even after the match; later answers
  /// are ignored. When some backend declares `id` as well known, only those backends are asked.
  [[nodiscard]] async::Future<device::DeviceList>
  get_devices_by_id(const std::string &id, std::optional<DiscoveryFilter> filter = std::nullopt);

  [[nodiscard]] async::Future<device::DeviceList>
  get_devices(std::optional<DiscoveryFilter> filter = std::nullopt);

  [[nodiscard]] SupportFilter device_support_filter(bool include_unsupported_by_project = false) const;

  /// With no specific device requested, the only ephemeral device in `devices`, if there is
  /// exactly one. Null otherwise.
  [[nodiscard]] device::DevicePtr get_single_ephemeral_device(const device::DeviceList &devices) const;

  [[nodiscard]] bool can_list_anything() const;

  [[nodiscard]] async::Future<std::vector<std::string>> get_device_diagnostics();

  [[nodiscard]] std::vector<DiscoveryPtr> eligible_backends() const;
  [[nodiscard]] const std::vector<DiscoveryPtr> &backends() const { return backends_; }

private:
  [[nodiscard]] async::Future<device::DeviceList>
  collect(const std::vector<async::Future<device::DeviceList>> &futures,
          const std::vector<DiscoveryPtr> &backends);

  common::Logger &logger_;
  std::vector<DiscoveryPtr> backends_;
  ProjectProvider project_provider_;
  std::optional<std::string> specified_;
};

} // namespace launchpad::discovery
