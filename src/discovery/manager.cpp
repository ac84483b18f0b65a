#include "launchpad/discovery/manager.hpp"

#include "launchpad/common/fs.hpp"

#include <algorithm>
#include <utility>

namespace launchpad::discovery {

namespace {

bool is_exact_match(const device::Device &device, const std::string &lowered_id) {
  return common::to_lower(device.id()) == lowered_id ||
         common::to_lower(device.name()) == lowered_id;
}

bool is_prefix_match(const device::Device &device, const std::string &lowered_id) {
  return common::starts_with(common::to_lower(device.id()), lowered_id) ||
         common::starts_with(common::to_lower(device.name()), lowered_id);
}

} // namespace

DeviceManager::DeviceManager(common::Logger &logger, std::vector<DiscoveryPtr> backends,
                             ProjectProvider project_provider)
    : logger_(logger), backends_(std::move(backends)), project_provider_(std::move(project_provider)) {}

std::optional<std::string> DeviceManager::specified_device_id() const {
  if (!specified_.has_value() || *specified_ == ALL_DEVICES) {
    return std::nullopt;
  }
  return specified_;
}

bool DeviceManager::has_specified_all_devices() const {
  return specified_.has_value() && *specified_ == ALL_DEVICES;
}

std::vector<DiscoveryPtr> DeviceManager::eligible_backends() const {
  std::vector<DiscoveryPtr> out;
  for (const auto &backend : backends_) {
    if (backend->supports_platform()) {
      out.push_back(backend);
    }
  }
  return out;
}

async::Future<device::DeviceList>
DeviceManager::get_all_devices(std::optional<DiscoveryFilter> filter) {
  const std::optional<DiscoveryFilter> effective = filter.value_or(DiscoveryFilter{});
  const auto backends = eligible_backends();
  std::vector<async::Future<device::DeviceList>> futures;
  futures.reserve(backends.size());
  for (const auto &backend : backends) {
    futures.push_back(backend->devices(effective));
  }
  return collect(futures, backends);
}

async::Future<device::DeviceList>
DeviceManager::refresh_all_devices(const std::optional<async::Duration> timeout,
                                   std::optional<DiscoveryFilter> filter) {
  const std::optional<DiscoveryFilter> effective = filter.value_or(DiscoveryFilter{});
  const auto backends = eligible_backends();
  std::vector<async::Future<device::DeviceList>> futures;
  futures.reserve(backends.size());
  for (const auto &backend : backends) {
    futures.push_back(backend->discover_devices(timeout, effective));
  }
  return collect(futures, backends);
}

async::Future<device::DeviceList>
DeviceManager::collect(const std::vector<async::Future<device::DeviceList>> &futures,
                       const std::vector<DiscoveryPtr> &backends) {
  auto &logger = logger_;
  return async::map_result<device::DeviceList>(
      async::when_all(futures),
      [&logger, backends](const common::Result<std::vector<common::Result<device::DeviceList>>> &all) {
        device::DeviceList out;
        const auto &results = all.value();
        for (std::size_t i = 0; i < results.size(); ++i) {
          if (!results[i].ok()) {
            logger.trace("Ignored error listing " + backends[i]->name() +
                         " devices: " + results[i].error());
            continue;
          }
          const auto &devices = results[i].value();
          out.insert(out.end(), devices.begin(), devices.end());
        }
        return common::Result<device::DeviceList>::success(std::move(out));
      });
}

async::Future<device::DeviceList>
DeviceManager::get_devices_by_id(const std::string &id, std::optional<DiscoveryFilter> filter) {
  const std::optional<DiscoveryFilter> effective = filter.value_or(DiscoveryFilter{});
  const auto lowered_id = common::to_lower(id);

  auto backends = eligible_backends();
  std::vector<DiscoveryPtr> well_known;
  for (const auto &backend : backends) {
    const auto ids = backend->well_known_ids();
    if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
      well_known.push_back(backend);
    }
  }
  if (!well_known.empty()) {
    backends = std::move(well_known);
  }

  async::Promise<device::DeviceList> promise;
  if (backends.empty()) {
    promise.resolve({});
    return promise.future();
  }

  // Prefix candidates per backend, so the fallback keeps registration order whatever order
  // the backends answer in.
  auto candidates = std::make_shared<std::vector<device::DeviceList>>(backends.size());
  auto remaining = std::make_shared<std::size_t>(backends.size());
  auto &logger = logger_;

  for (std::size_t i = 0; i < backends.size(); ++i) {
    const auto name = backends[i]->name();
    backends[i]->devices(effective).then(
        [promise, candidates, remaining, i, lowered_id, id, name,
         &logger](const common::Result<device::DeviceList> &result) mutable {
          if (!result.ok()) {
            logger.trace("Ignored error discovering " + id + " on " + name + ": " + result.error());
          }
          if (promise.is_settled()) {
            return;
          }
          if (result.ok()) {
            for (const auto &device : result.value()) {
              if (is_exact_match(*device, lowered_id)) {
                promise.resolve({device});
                return;
              }
              if (is_prefix_match(*device, lowered_id)) {
                (*candidates)[i].push_back(device);
              }
            }
          }
          if (--(*remaining) > 0) {
            return;
          }
          device::DeviceList out;
          for (const auto &slot : *candidates) {
            out.insert(out.end(), slot.begin(), slot.end());
          }
          promise.resolve(std::move(out));
        });
  }
  return promise.future();
}

async::Future<device::DeviceList> DeviceManager::get_devices(std::optional<DiscoveryFilter> filter) {
  const auto id = specified_device_id();
  if (!id.has_value()) {
    return get_all_devices(std::move(filter));
  }
  return get_devices_by_id(*id, std::move(filter));
}

SupportFilter DeviceManager::device_support_filter(const bool include_unsupported_by_project) const {
  std::shared_ptr<const device::ProjectContext> project;
  if (!include_unsupported_by_project && project_provider_) {
    project = project_provider_();
  }
  if (has_specified_all_devices()) {
    return SupportFilter::exclude_devices_unsupported_by_tool_or_project_or_all(project);
  }
  if (!has_specified_device_id()) {
    return SupportFilter::exclude_devices_unsupported_by_tool_or_project(project);
  }
  return SupportFilter::exclude_devices_unsupported_by_tool();
}

device::DevicePtr DeviceManager::get_single_ephemeral_device(const device::DeviceList &devices) const {
  if (has_specified_device_id()) {
    return nullptr;
  }
  device::DevicePtr found;
  for (const auto &device : devices) {
    if (!device->ephemeral()) {
      continue;
    }
    if (found) {
      return nullptr;
    }
    found = device;
  }
  return found;
}

bool DeviceManager::can_list_anything() const {
  const auto backends = eligible_backends();
  return std::any_of(backends.begin(), backends.end(),
                     [](const DiscoveryPtr &backend) { return backend->can_list_anything(); });
}

async::Future<std::vector<std::string>> DeviceManager::get_device_diagnostics() {
  const auto backends = eligible_backends();
  std::vector<async::Future<std::vector<std::string>>> futures;
  futures.reserve(backends.size());
  for (const auto &backend : backends) {
    futures.push_back(backend->diagnostics());
  }

  auto &logger = logger_;
  return async::map_result<std::vector<std::string>>(
      async::when_all(futures),
      [&logger, backends](
          const common::Result<std::vector<common::Result<std::vector<std::string>>>> &all) {
        std::vector<std::string> out;
        const auto &results = all.value();
        for (std::size_t i = 0; i < results.size(); ++i) {
          if (!results[i].ok()) {
            logger.trace("Ignored error collecting " + backends[i]->name() +
                         " diagnostics: " + results[i].error());
            continue;
          }
          out.insert(out.end(), results[i].value().begin(), results[i].value().end());
        }
        return common::Result<std::vector<std::string>>::success(std::move(out));
      });
}

} // namespace launchpad::discovery
