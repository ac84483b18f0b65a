#include "launchpad/discovery/polling.hpp"

#include <utility>

namespace launchpad::discovery {

PollingDeviceDiscovery::PollingDeviceDiscovery(async::EventLoop &loop, common::Logger &logger,
                                               std::string name, PollingOptions options)
    : loop_(loop), logger_(logger), name_(std::move(name)), options_(options) {}

PollingDeviceDiscovery::~PollingDeviceDiscovery() { dispose(); }

async::Future<device::DeviceList>
PollingDeviceDiscovery::devices(const std::optional<DiscoveryFilter> &filter) {
  if (populated_) {
    return apply_filter(notifier_.items(), filter);
  }

  // Callers arriving while the first enumeration runs share it.
  if (!population_in_flight_) {
    population_in_flight_ = true;
    std::weak_ptr<bool> alive = alive_;
    pending_population_ = async::map_result<device::DeviceList>(
        enumerate(std::nullopt), [this, alive](const common::Result<device::DeviceList> &result) {
          if (alive.expired()) {
            return result;
          }
          population_in_flight_ = false;
          if (!result.ok()) {
            return result;
          }
          // An explicit refresh that finished first wins.
          if (!populated_) {
            replace_cache(result.value());
          }
          return common::Result<device::DeviceList>::success(notifier_.items());
        });
  }

  return async::flat_map<device::DeviceList>(
      pending_population_,
      [filter](const device::DeviceList &devices) { return apply_filter(devices, filter); });
}

async::Future<device::DeviceList>
PollingDeviceDiscovery::discover_devices(const std::optional<async::Duration> timeout,
                                         const std::optional<DiscoveryFilter> &filter) {
  std::weak_ptr<bool> alive = alive_;
  const auto refreshed = async::map_result<device::DeviceList>(
      enumerate(timeout), [this, alive](const common::Result<device::DeviceList> &result) {
        if (alive.expired()) {
          return result;
        }
        if (result.ok()) {
          replace_cache(result.value());
          return common::Result<device::DeviceList>::success(notifier_.items());
        }
        if (async::is_timeout(result.error())) {
          logger_.trace(name_ + " device discovery timed out, keeping cached devices");
          return common::Result<device::DeviceList>::success(notifier_.items());
        }
        return result;
      });

  return async::flat_map<device::DeviceList>(
      refreshed, [filter](const device::DeviceList &devices) { return apply_filter(devices, filter); });
}

void PollingDeviceDiscovery::start_polling() {
  if (polling_ || disposed_) {
    return;
  }
  polling_ = true;
  state_ = PollingState::Started;
  ++generation_;
  // The first background enumeration is unbounded, like a first read.
  arm_timer(options_.polling_interval, std::nullopt);
}

void PollingDeviceDiscovery::stop_polling() {
  polling_ = false;
  ++generation_;
  if (timer_.has_value()) {
    loop_.cancel(*timer_);
    timer_.reset();
  }
  state_ = PollingState::Idle;
}

void PollingDeviceDiscovery::dispose() {
  stop_polling();
  disposed_ = true;
}

SubscriptionId PollingDeviceDiscovery::on_added(DeviceCallback callback) {
  return notifier_.on_added(std::move(callback));
}

SubscriptionId PollingDeviceDiscovery::on_removed(DeviceCallback callback) {
  return notifier_.on_removed(std::move(callback));
}

bool PollingDeviceDiscovery::unsubscribe(const SubscriptionId id) {
  return notifier_.unsubscribe(id);
}

async::Future<device::DeviceList>
PollingDeviceDiscovery::enumerate(const std::optional<async::Duration> timeout) {
  auto raw = poll_devices(timeout);
  if (!timeout.has_value()) {
    return raw;
  }
  return async::with_timeout(loop_, raw, *timeout);
}

void PollingDeviceDiscovery::replace_cache(const device::DeviceList &devices) {
  populated_ = true;
  notifier_.update_with_new_list(devices);
}

void PollingDeviceDiscovery::arm_timer(const async::Duration delay,
                                       const std::optional<async::Duration> timeout) {
  std::weak_ptr<bool> alive = alive_;
  const auto generation = generation_;
  timer_ = loop_.schedule(delay, [this, alive, timeout, generation]() {
    if (alive.expired()) {
      return;
    }
    timer_.reset();
    tick(timeout, generation);
  });
}

void PollingDeviceDiscovery::tick(const std::optional<async::Duration> timeout,
                                  const std::uint64_t generation) {
  std::weak_ptr<bool> alive = alive_;
  enumerate(timeout).then([this, alive, generation](const common::Result<device::DeviceList> &result) {
    if (alive.expired()) {
      return;
    }
    if (generation != generation_ || !polling_) {
      // Polling was stopped (and maybe restarted) while this tick ran.
      return;
    }
    if (result.ok()) {
      replace_cache(result.value());
    } else if (!async::is_timeout(result.error())) {
      logger_.trace(name_ + " device polling failed: " + result.error());
    }
    state_ = PollingState::Steady;
    arm_timer(options_.steady_interval, options_.poll_timeout);
  });
}

} // namespace launchpad::discovery
