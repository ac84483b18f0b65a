#pragma once

#include "launchpad/async/future.hpp"
#include "launchpad/device/device.hpp"

#include <optional>
#include <string>
#include <vector>

namespace launchpad::device {

struct DeviceSummary {
  std::string name;
  std::string id;
  std::optional<Category> category;
  bool supported = false;
  TargetPlatform target = TargetPlatform::Tester;
  std::string target_platform;
  bool emulator = false;
  std::string sdk;
  DeviceCapabilities capabilities;
  bool hardware_rendering = false;
};

[[nodiscard]] async::Future<DeviceSummary> summarize(const DevicePtr &device);
[[nodiscard]] async::Future<std::vector<DeviceSummary>> summarize_all(const DeviceList &devices);

/// Machine-readable record: name, id, isSupported, targetPlatform, emulator, sdk and a
/// capabilities object.
[[nodiscard]] std::string to_json(const DeviceSummary &summary);
[[nodiscard]] std::string to_json(const std::vector<DeviceSummary> &summaries);

/// Aligned table rows: "name (category) • id • platform • sdk (markers)".
[[nodiscard]] std::vector<std::string> descriptions(const std::vector<DeviceSummary> &summaries);

} // namespace launchpad::device
