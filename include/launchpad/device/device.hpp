#pragma once

#include "launchpad/async/future.hpp"
#include "launchpad/device/project.hpp"
#include "launchpad/device/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace launchpad::device {

struct DeviceCapabilities {
  bool hot_reload = true;
  bool hot_restart = true;
  bool screenshot = false;
  bool fast_start = false;
  bool clean_exit = true;
  bool start_paused = true;
};

class DeviceLogReader {
public:
  virtual ~DeviceLogReader() = default;

  [[nodiscard]] virtual std::string name() const = 0;
  virtual void dispose() = 0;
};

class NoOpDeviceLogReader final : public DeviceLogReader {
public:
  explicit NoOpDeviceLogReader(std::string name) : name_(std::move(name)) {}

  [[nodiscard]] std::string name() const override { return name_; }
  void dispose() override {}

private:
  std::string name_;
};

class DevicePortForwarder {
public:
  virtual ~DevicePortForwarder() = default;

  [[nodiscard]] virtual std::string name() const = 0;
  virtual void dispose() = 0;
};

class NoOpDevicePortForwarder final : public DevicePortForwarder {
public:
  explicit NoOpDevicePortForwarder(std::string name) : name_(std::move(name)) {}

  [[nodiscard]] std::string name() const override { return name_; }
  void dispose() override {}

private:
  std::string name_;
};

/// A target an application can be deployed to: a phone, an emulator, the host desktop, a
/// browser or an attached board.
///
/// Identity is the ID alone. Name, connectivity and everything else may change between
/// enumerations without the device becoming a different device.
class Device {
public:
  Device(std::string id, std::optional<Category> category, std::optional<PlatformType> platform_type,
         bool ephemeral);
  virtual ~Device() = default;

  Device(const Device &) = delete;
  Device &operator=(const Device &) = delete;

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] std::optional<Category> category() const { return category_; }
  [[nodiscard]] std::optional<PlatformType> platform_type() const { return platform_type_; }

  [[nodiscard]] bool ephemeral() const { return ephemeral_; }

  [[nodiscard]] virtual std::string name() const = 0;
  [[nodiscard]] virtual bool is_connected() const = 0;
  [[nodiscard]] virtual ConnectionInterface connection_interface() const = 0;
  [[nodiscard]] bool is_wirelessly_connected() const {
    return connection_interface() == ConnectionInterface::Wireless;
  }

  [[nodiscard]] virtual bool is_supported() const = 0;
  /// Whether `project` can be deployed to this device (e.g. it still has the platform folder).
  [[nodiscard]] virtual bool is_supported_for_project(const ProjectContext &project) const = 0;

  [[nodiscard]] virtual async::Future<TargetPlatform> target_platform() const = 0;
  [[nodiscard]] virtual async::Future<bool> is_local_emulator() const = 0;
  [[nodiscard]] virtual async::Future<std::string> sdk_name_and_version() const = 0;
  [[nodiscard]] virtual async::Future<bool> supports_hardware_rendering() const = 0;

  [[nodiscard]] virtual DeviceCapabilities capabilities() const = 0;
  [[nodiscard]] virtual std::shared_ptr<DeviceLogReader> log_reader() = 0;
  [[nodiscard]] virtual std::shared_ptr<DevicePortForwarder> port_forwarder() = 0;

  /// Releases the log reader and port forwarder.
  virtual void dispose();

private:
  std::string id_;
  std::optional<Category> category_;
  std::optional<PlatformType> platform_type_;
  bool ephemeral_ = false;
};

using DevicePtr = std::shared_ptr<Device>;
using DeviceList = std::vector<DevicePtr>;

[[nodiscard]] inline bool operator==(const Device &lhs, const Device &rhs) {
  return lhs.id() == rhs.id();
}
[[nodiscard]] inline bool operator!=(const Device &lhs, const Device &rhs) { return !(lhs == rhs); }

struct DeviceIdHash {
  [[nodiscard]] std::size_t operator()(const DevicePtr &device) const;
};

struct DeviceIdEqual {
  [[nodiscard]] bool operator()(const DevicePtr &lhs, const DevicePtr &rhs) const {
    return lhs->id() == rhs->id();
  }
};

[[nodiscard]] DeviceCapabilities default_capabilities();

[[nodiscard]] std::string support_message(const Device &device);

[[nodiscard]] std::vector<std::string> platform_types(const DeviceList &devices);

template <typename T> [[nodiscard]] async::Future<T> known(T value) {
  return async::Future<T>::ready(std::move(value));
}

} // namespace launchpad::device
