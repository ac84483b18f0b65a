#include "launchpad/backends/serial_discovery.hpp"

#include "launchpad/common/fs.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <cstdio>
#include <set>
#include <utility>

namespace launchpad::backends {

namespace {

constexpr std::size_t ID_HEX_DIGITS = 12;

void collect_entries(const std::filesystem::path &directory, const std::string &prefix,
                     std::set<std::string> &out_paths) {
  std::error_code ec;
  if (!std::filesystem::exists(directory, ec) || !std::filesystem::is_directory(directory, ec)) {
    return;
  }

  for (const auto &entry : std::filesystem::directory_iterator(directory, ec)) {
    if (ec) {
      break;
    }
    const auto name = entry.path().filename().string();
    if (!prefix.empty() && !common::starts_with(name, prefix)) {
      continue;
    }
    out_paths.insert(entry.path().string());
  }
}

} // namespace

std::string guess_board_name(const std::string &device_path) {
  const std::string path = common::to_lower(device_path);

  if (path.find("stlink") != std::string::npos || path.find("acm") != std::string::npos) {
    return "nucleo-f4";
  }
  if (path.find("usbmodem") != std::string::npos || path.find("wchusbserial") != std::string::npos ||
      path.find("arduino") != std::string::npos) {
    return "arduino-uno";
  }
  if (path.find("usbserial") != std::string::npos || path.find("cp210") != std::string::npos ||
      path.find("ttyusb") != std::string::npos) {
    return "esp32";
  }
  return "serial-device";
}

std::string serial_device_id(const std::string &device_path) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);
  EVP_DigestUpdate(ctx, device_path.c_str(), device_path.size());
  unsigned int hash_len = 0;
  EVP_DigestFinal_ex(ctx, hash, &hash_len);
  EVP_MD_CTX_free(ctx);

  std::string out = "serial-";
  char byte[3];
  for (std::size_t i = 0; i < ID_HEX_DIGITS / 2; ++i) {
    std::snprintf(byte, sizeof(byte), "%02x", static_cast<unsigned int>(hash[i]));
    out += byte;
  }
  return out;
}

std::vector<std::string> list_serial_paths(const std::filesystem::path &dev_root,
                                           const std::vector<std::string> &extra_prefixes) {
  std::set<std::string> links;
  std::set<std::string> link_targets;
  std::error_code ec;
  const auto by_id = dev_root / "serial" / "by-id";
  if (std::filesystem::exists(by_id, ec) && std::filesystem::is_directory(by_id, ec)) {
    for (const auto &entry : std::filesystem::directory_iterator(by_id, ec)) {
      if (ec) {
        break;
      }
      links.insert(entry.path().string());
      std::error_code target_ec;
      const auto target = std::filesystem::weakly_canonical(entry.path(), target_ec);
      if (!target_ec) {
        link_targets.insert(target.string());
      }
    }
  }

  std::set<std::string> raw;
  collect_entries(dev_root, "ttyUSB", raw);
  collect_entries(dev_root, "ttyACM", raw);
  collect_entries(dev_root, "tty.", raw);
  collect_entries(dev_root, "cu.", raw);
  for (const auto &prefix : extra_prefixes) {
    if (!prefix.empty()) {
      collect_entries(dev_root, prefix, raw);
    }
  }

  std::set<std::string> paths = links;
  for (const auto &path : raw) {
    std::error_code canonical_ec;
    const auto canonical = std::filesystem::weakly_canonical(path, canonical_ec);
    if (!canonical_ec && link_targets.count(canonical.string()) > 0) {
      continue;
    }
    paths.insert(path);
  }
  return {paths.begin(), paths.end()};
}

SerialDevice::SerialDevice(std::string path)
    : device::Device(serial_device_id(path), device::Category::Mobile, device::PlatformType::Custom, true),
      path_(std::move(path)), board_(guess_board_name(path_)),
      log_reader_(std::make_shared<device::NoOpDeviceLogReader>(path_)),
      port_forwarder_(std::make_shared<device::NoOpDevicePortForwarder>(path_)) {}

std::string SerialDevice::name() const {
  return board_ + " (" + std::filesystem::path(path_).filename().string() + ")";
}

bool SerialDevice::is_connected() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

device::DeviceCapabilities SerialDevice::capabilities() const {
  device::DeviceCapabilities caps;
  caps.hot_reload = false;
  caps.hot_restart = false;
  caps.screenshot = false;
  caps.fast_start = false;
  caps.clean_exit = false;
  caps.start_paused = false;
  return caps;
}

SerialDiscovery::SerialDiscovery(async::EventLoop &loop, common::Logger &logger,
                                 std::vector<std::string> extra_prefixes,
                                 const discovery::PollingOptions options, std::filesystem::path dev_root)
    : discovery::PollingDeviceDiscovery(loop, logger, "serial", options),
      extra_prefixes_(std::move(extra_prefixes)), dev_root_(std::move(dev_root)) {}

bool SerialDiscovery::supports_platform() const {
#if defined(_WIN32)
  return false;
#else
  return true;
#endif
}

async::Future<device::DeviceList>
SerialDiscovery::poll_devices(const std::optional<async::Duration> timeout) {
  // Listing device nodes does not block on hardware.
  (void)timeout;
  device::DeviceList devices;
  for (const auto &path : list_serial_paths(dev_root_, extra_prefixes_)) {
    devices.push_back(std::make_shared<SerialDevice>(path));
  }
  logger().trace("serial: found " + std::to_string(devices.size()) + " device node(s)");
  return async::Future<device::DeviceList>::ready(std::move(devices));
}

} // namespace launchpad::backends
