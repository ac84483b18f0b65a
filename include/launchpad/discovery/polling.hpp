#pragma once

#include "launchpad/async/event_loop.hpp"
#include "launchpad/common/logger.hpp"
#include "launchpad/discovery/discovery.hpp"
#include "launchpad/discovery/notifier.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace launchpad::discovery {

struct PollingOptions {
  async::Duration polling_interval{4000};
  async::Duration steady_interval{30000};
  async::Duration poll_timeout{30000};
};

enum class PollingState { Idle, Started, Steady };

/// Backend that caches an expensive enumeration and can keep it fresh in the background.
///
/// Subclasses supply poll_devices(). Reads are served from the cache once it has been
/// populated; only discover_devices() forces a new enumeration on the caller's behalf.
/// Background polling refreshes the cache and reports added/removed devices, but a read never
/// re-enumerates just because time has passed.
///
/// Must not outlive the EventLoop it was built with.
class PollingDeviceDiscovery : public DeviceDiscovery {
public:
  PollingDeviceDiscovery(async::EventLoop &loop, common::Logger &logger, std::string name,
                         PollingOptions options = {});
  ~PollingDeviceDiscovery() override;

  PollingDeviceDiscovery(const PollingDeviceDiscovery &) = delete;
  PollingDeviceDiscovery &operator=(const PollingDeviceDiscovery &) = delete;

  [[nodiscard]] std::string name() const override { return name_; }

  [[nodiscard]] async::Future<device::DeviceList>
  devices(const std::optional<DiscoveryFilter> &filter) override;

  [[nodiscard]] async::Future<device::DeviceList>
  discover_devices(std::optional<async::Duration> timeout,
                   const std::optional<DiscoveryFilter> &filter) override;

  void start_polling();
  void stop_polling();
  /// Stops polling for good; start_polling() is a no-op afterwards.
  void dispose();

  SubscriptionId on_added(DeviceCallback callback);
  SubscriptionId on_removed(DeviceCallback callback);
  bool unsubscribe(SubscriptionId id);

  [[nodiscard]] PollingState state() const { return state_; }
  [[nodiscard]] bool is_polling() const { return polling_; }
  [[nodiscard]] bool is_populated() const { return populated_; }
  [[nodiscard]] bool is_disposed() const { return disposed_; }
  [[nodiscard]] const device::DeviceList &cached_devices() const { return notifier_.items(); }

protected:
  /// Enumerate now. Implementations should bound themselves by `timeout` when one is given;
  /// the engine enforces it as well.
  [[nodiscard]] virtual async::Future<device::DeviceList>
  poll_devices(std::optional<async::Duration> timeout) = 0;

  [[nodiscard]] async::EventLoop &loop() { return loop_; }
  [[nodiscard]] common::Logger &logger() { return logger_; }

private:
  [[nodiscard]] async::Future<device::DeviceList> enumerate(std::optional<async::Duration> timeout);
  void replace_cache(const device::DeviceList &devices);
  void arm_timer(async::Duration delay, std::optional<async::Duration> timeout);
  void tick(std::optional<async::Duration> timeout, std::uint64_t generation);

  async::EventLoop &loop_;
  common::Logger &logger_;
  std::string name_;
  PollingOptions options_;

  ItemListNotifier notifier_;
  bool populated_ = false;
  bool population_in_flight_ = false;
  async::Future<device::DeviceList> pending_population_;

  PollingState state_ = PollingState::Idle;
  bool polling_ = false;
  bool disposed_ = false;
  std::optional<async::TimerId> timer_;
  std::uint64_t generation_ = 0;

  // Continuations hold a weak reference so a destroyed backend is never touched.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace launchpad::discovery
