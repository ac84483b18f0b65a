#pragma once

#include "launchpad/device/device.hpp"

#include <cstdint>
#include <functional>
#include <map>

namespace launchpad::discovery {

using DeviceCallback = std::function<void(const device::DevicePtr &)>;
using SubscriptionId = std::uint64_t;

/// Device list that reports membership changes. Membership is by ID: a device whose name or
/// connectivity changed between two lists is neither added nor removed.
class ItemListNotifier {
public:
  [[nodiscard]] const device::DeviceList &items() const { return items_; }

  /// Replace the list. Fires `added` for IDs only in `updated`, then `removed` for IDs only in
  /// the previous list.
  void update_with_new_list(device::DeviceList updated);

  SubscriptionId on_added(DeviceCallback callback);
  SubscriptionId on_removed(DeviceCallback callback);
  bool unsubscribe(SubscriptionId id);

private:
  static void notify(const std::map<SubscriptionId, DeviceCallback> &listeners,
                     const device::DevicePtr &device);

  device::DeviceList items_;
  std::map<SubscriptionId, DeviceCallback> added_;
  std::map<SubscriptionId, DeviceCallback> removed_;
  SubscriptionId next_id_ = 1;
};

} // namespace launchpad::discovery
