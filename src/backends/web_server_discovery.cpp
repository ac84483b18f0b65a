#include "launchpad/backends/web_server_discovery.hpp"

namespace launchpad::backends {

WebServerDevice::WebServerDevice()
    : device::Device(WEB_SERVER_DEVICE_ID, device::Category::Web, device::PlatformType::Web, false),
      log_reader_(std::make_shared<device::NoOpDeviceLogReader>("web-server")),
      port_forwarder_(std::make_shared<device::NoOpDevicePortForwarder>("web-server")) {}

device::DeviceCapabilities WebServerDevice::capabilities() const {
  auto caps = device::default_capabilities();
  // The page is closed by the user, never by the tool.
  caps.clean_exit = false;
  caps.start_paused = false;
  return caps;
}

WebServerDiscovery::WebServerDiscovery() : device_(std::make_shared<WebServerDevice>()) {}

} // namespace launchpad::backends
