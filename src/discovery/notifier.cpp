#include "launchpad/discovery/notifier.hpp"

#include <unordered_set>
#include <utility>

namespace launchpad::discovery {

void ItemListNotifier::update_with_new_list(device::DeviceList updated) {
  std::unordered_set<std::string> previous_ids;
  for (const auto &device : items_) {
    previous_ids.insert(device->id());
  }
  std::unordered_set<std::string> updated_ids;
  for (const auto &device : updated) {
    updated_ids.insert(device->id());
  }

  device::DeviceList added;
  for (const auto &device : updated) {
    if (previous_ids.count(device->id()) == 0) {
      added.push_back(device);
    }
  }
  device::DeviceList removed;
  for (const auto &device : items_) {
    if (updated_ids.count(device->id()) == 0) {
      removed.push_back(device);
    }
  }

  items_ = std::move(updated);

  // Listeners may subscribe or unsubscribe from inside a callback.
  const auto added_listeners = added_;
  for (const auto &device : added) {
    notify(added_listeners, device);
  }
  const auto removed_listeners = removed_;
  for (const auto &device : removed) {
    notify(removed_listeners, device);
  }
}

SubscriptionId ItemListNotifier::on_added(DeviceCallback callback) {
  const auto id = next_id_++;
  added_.emplace(id, std::move(callback));
  return id;
}

SubscriptionId ItemListNotifier::on_removed(DeviceCallback callback) {
  const auto id = next_id_++;
  removed_.emplace(id, std::move(callback));
  return id;
}

bool ItemListNotifier::unsubscribe(const SubscriptionId id) {
  return added_.erase(id) > 0 || removed_.erase(id) > 0;
}

void ItemListNotifier::notify(const std::map<SubscriptionId, DeviceCallback> &listeners,
                              const device::DevicePtr &device) {
  for (const auto &[id, callback] : listeners) {
    (void)id;
    callback(device);
  }
}

} // namespace launchpad::discovery
