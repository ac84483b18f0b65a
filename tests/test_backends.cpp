#include "test_framework.hpp"

#include "fakes.hpp"

#include "launchpad/backends/adb_discovery.hpp"
#include "launchpad/backends/linux_discovery.hpp"
#include "launchpad/backends/serial_discovery.hpp"
#include "launchpad/backends/web_server_discovery.hpp"
#include "launchpad/common/logger.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace {

using launchpad::async::Duration;
using launchpad::async::EventLoop;
using launchpad::backends::AdbDiscovery;
using launchpad::common::BufferLogger;
using launchpad::common::Result;
using launchpad::device::ConnectionInterface;
using launchpad::device::TargetPlatform;
using launchpad::tests::ids_of;

constexpr const char *ADB_OUTPUT = "List of devices attached\n"
                                   "emulator-5554          device product:sdk_gphone64 model:sdk_gphone64_x86_64 device:emu64x transport_id:1\n"
                                   "R58M123ABC             device usb:1-1 product:beyond1 model:SM_G973F device:beyond1 transport_id:2\n"
                                   "192.168.1.20:5555      offline transport_id:3\n"
                                   "adb-XYZ._adb-tls-connect._tcp device product:oriole model:Pixel_6 device:oriole\n"
                                   "0123456789             unauthorized usb:1-2 transport_id:4\n"
                                   "FA7AB1A00000           no permissions (user not in plugdev group); see [http://developer.android.com/tools/device.html]\n"
                                   "\n";

std::filesystem::path make_temp_dir(const std::string &label) {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto path = std::filesystem::temp_directory_path() /
                    ("launchpad-" + label + "-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void touch(const std::filesystem::path &path) {
  std::ofstream out(path);
  out << "";
}

std::shared_ptr<AdbDiscovery> fake_adb(EventLoop &loop, BufferLogger &logger, std::string output) {
  return std::make_shared<AdbDiscovery>(
      loop, logger, "adb", launchpad::discovery::PollingOptions{},
      [output](const std::vector<std::string> &argv) -> Result<std::string> {
        if (argv.size() >= 2 && argv[1] == "devices") {
          return Result<std::string>::success(output);
        }
        if (argv.size() >= 5 && argv[4] == "getprop") {
          return Result<std::string>::success("[ro.product.cpu.abi]: [x86_64]\n"
                                              "[ro.build.version.release]: [14]\n"
                                              "[ro.build.version.sdk]: [34]\n"
                                              "[ro.hardware.egl]: [emulation]\n");
        }
        return Result<std::string>::failure("unexpected adb invocation");
      },
      [](const std::string &) { return true; });
}

} // namespace

void register_backend_tests(std::vector<launchpad::tests::TestCase> &tests) {
  using launchpad::tests::require;

  tests.push_back({"backend_adb_parse_states_and_attributes", [] {
                     const auto listing = launchpad::backends::parse_adb_devices(ADB_OUTPUT);
                     require(listing.devices.size() == 5, "device, offline and unauthorized entries are kept");
                     require(listing.devices[0].serial == "emulator-5554", "first serial");
                     require(listing.devices[0].model == "sdk_gphone64_x86_64", "model parsed");
                     require(listing.devices[1].product == "beyond1", "product parsed");
                     require(listing.devices[2].state == "offline", "offline state kept");
                     require(listing.diagnostics.size() == 3, "offline, unauthorized and unknown are reported");
                     require(listing.diagnostics[0].find("192.168.1.20:5555 is offline") != std::string::npos,
                             "offline diagnostic");
                     require(listing.diagnostics[1].find("not authorized") != std::string::npos,
                             "unauthorized diagnostic");
                     require(listing.diagnostics[2].find("FA7AB1A00000") != std::string::npos,
                             "unexpected state reported");
                   }});

  tests.push_back({"backend_adb_serial_classification", [] {
                     using launchpad::backends::is_emulator_serial;
                     using launchpad::backends::is_wireless_serial;
                     require(is_emulator_serial("emulator-5554"), "emulator serial");
                     require(!is_emulator_serial("emulator-"), "missing port");
                     require(!is_emulator_serial("emulator-55x4"), "non-numeric port");
                     require(is_wireless_serial("192.168.1.20:5555"), "host:port is wireless");
                     require(is_wireless_serial("adb-XYZ._adb-tls-connect._tcp"), "mdns is wireless");
                     require(!is_wireless_serial("R58M123ABC"), "usb serial");
                   }});

  tests.push_back({"backend_adb_getprop_and_abi", [] {
                     const auto props = launchpad::backends::parse_getprop(
                         "[ro.product.cpu.abi]: [arm64-v8a]\n[empty]: []\nnot a prop\n");
                     require(props.at("ro.product.cpu.abi") == "arm64-v8a", "abi parsed");
                     require(props.at("empty").empty(), "empty values kept");
                     require(props.size() == 2, "junk lines skipped");
                     using launchpad::backends::android_target_for_abi;
                     require(android_target_for_abi("arm64-v8a") == TargetPlatform::AndroidArm64, "arm64");
                     require(android_target_for_abi("armeabi-v7a") == TargetPlatform::AndroidArm, "arm");
                     require(android_target_for_abi("x86_64") == TargetPlatform::AndroidX64, "x64");
                     require(android_target_for_abi("x86") == TargetPlatform::AndroidX86, "x86");
                     require(android_target_for_abi("mips") == TargetPlatform::Android, "fallback");
                   }});

  tests.push_back({"backend_adb_discovery_lists_devices", [] {
                     EventLoop loop;
                     BufferLogger logger;
                     auto adb = fake_adb(loop, logger, ADB_OUTPUT);
                     const auto all = launchpad::async::wait(
                         loop, adb->devices(launchpad::discovery::DiscoveryFilter(false)), Duration(5000));
                     require(all.ok(), "listing should succeed: " + (all.ok() ? std::string() : all.error()));
                     require(all.value().size() == 5, "all parsed devices listed");

                     const auto connected = launchpad::async::wait(
                         loop, adb->devices(launchpad::discovery::DiscoveryFilter{}), Duration(5000));
                     require(ids_of(connected.value()) ==
                                 std::vector<std::string>({"emulator-5554", "R58M123ABC",
                                                           "adb-XYZ._adb-tls-connect._tcp"}),
                             "disconnected devices filtered by default");

                     const auto &emulator = connected.value()[0];
                     require(emulator->name() == "sdk gphone64 x86 64", "underscores become spaces");
                     require(emulator->ephemeral(), "android devices are ephemeral");
                     require(emulator->category() == launchpad::device::Category::Mobile, "mobile");
                     require(connected.value()[2]->connection_interface() == ConnectionInterface::Wireless,
                             "mdns device is wireless");

                     const auto target = launchpad::async::wait(loop, emulator->target_platform(), Duration(5000));
                     require(target.ok() && target.value() == TargetPlatform::AndroidX64, "abi from getprop");
                     const auto sdk = launchpad::async::wait(loop, emulator->sdk_name_and_version(), Duration(5000));
                     require(sdk.ok() && sdk.value() == "Android 14 (API 34)", "sdk from getprop");
                     const auto is_emulator = launchpad::async::wait(loop, emulator->is_local_emulator());
                     require(is_emulator.ok() && is_emulator.value(), "emulator detected from serial");
                     const auto rendering =
                         launchpad::async::wait(loop, emulator->supports_hardware_rendering(), Duration(5000));
                     require(rendering.ok() && rendering.value(), "host gpu emulation renders in hardware");

                     const auto diagnostics = launchpad::async::wait(loop, adb->diagnostics(), Duration(5000));
                     require(diagnostics.ok() && diagnostics.value().size() == 3, "parse diagnostics exposed");
                   }});

  tests.push_back({"backend_adb_missing_tool", [] {
                     EventLoop loop;
                     BufferLogger logger;
                     auto calls = std::make_shared<std::atomic<int>>(0);
                     AdbDiscovery adb(
                         loop, logger, "/nonexistent/adb", {},
                         [calls](const std::vector<std::string> &) {
                           ++(*calls);
                           return Result<std::string>::failure("should not run");
                         },
                         [](const std::string &) { return false; });
                     require(!adb.can_list_anything(), "missing adb cannot list");
                     const auto listed = launchpad::async::wait(loop, adb.devices(std::nullopt));
                     require(listed.ok() && listed.value().empty(), "missing adb lists nothing");
                     const auto diagnostics = launchpad::async::wait(loop, adb.diagnostics());
                     require(diagnostics.ok() && diagnostics.value().size() == 1, "one diagnostic");
                     require(diagnostics.value()[0].find("/nonexistent/adb") != std::string::npos,
                             "diagnostic names the path");
                     require(calls->load() == 0, "adb is never invoked");
                   }});

  tests.push_back({"backend_adb_failure_propagates_to_caller", [] {
                     EventLoop loop;
                     BufferLogger logger;
                     AdbDiscovery adb(
                         loop, logger, "adb", {},
                         [](const std::vector<std::string> &) {
                           return Result<std::string>::failure("adb exited with status 1");
                         },
                         [](const std::string &) { return true; });
                     const auto listed = launchpad::async::wait(loop, adb.devices(std::nullopt), Duration(5000));
                     require(!listed.ok() && listed.error() == "adb exited with status 1", "error surfaces");
                     const auto diagnostics = launchpad::async::wait(loop, adb.diagnostics(), Duration(5000));
                     require(diagnostics.ok() && diagnostics.value().size() == 1 &&
                                 diagnostics.value()[0].find("Unable to run adb") != std::string::npos,
                             "failure reported as a diagnostic");
                   }});

  tests.push_back({"backend_serial_paths_and_ids", [] {
                     const auto dev = make_temp_dir("dev");
                     touch(dev / "ttyUSB0");
                     touch(dev / "ttyACM1");
                     touch(dev / "ttyAMA0");
                     touch(dev / "null");
                     std::filesystem::create_directories(dev / "serial" / "by-id");
                     std::filesystem::create_symlink(dev / "ttyACM1",
                                                     dev / "serial" / "by-id" / "usb-STMicro_STLink-if02");

                     const auto paths = launchpad::backends::list_serial_paths(dev, {});
                     require(paths.size() == 2, "by-id link hides its raw node");
                     require(paths[0] == (dev / "serial" / "by-id" / "usb-STMicro_STLink-if02").string(),
                             "by-id link listed");
                     require(paths[1] == (dev / "ttyUSB0").string(), "raw node listed");

                     const auto extra = launchpad::backends::list_serial_paths(dev, {"ttyAMA"});
                     require(extra.size() == 3, "extra prefixes are honoured");

                     const auto id = launchpad::backends::serial_device_id("/dev/ttyUSB0");
                     require(id.size() == std::string("serial-").size() + 12, "short hex id");
                     require(id.rfind("serial-", 0) == 0, "serial- prefix");
                     require(id == launchpad::backends::serial_device_id("/dev/ttyUSB0"), "stable");
                     require(id != launchpad::backends::serial_device_id("/dev/ttyUSB1"), "distinct");

                     require(launchpad::backends::guess_board_name("/dev/cu.usbmodem1101") == "arduino-uno",
                             "usbmodem is an arduino");
                     require(launchpad::backends::guess_board_name(paths[0]) == "nucleo-f4", "stlink");
                     std::filesystem::remove_all(dev);
                   }});

  tests.push_back({"backend_serial_discovery_devices", [] {
                     const auto dev = make_temp_dir("serial");
                     touch(dev / "ttyUSB0");
                     EventLoop loop;
                     BufferLogger logger;
                     launchpad::backends::SerialDiscovery serial(loop, logger, {}, {}, dev);
                     const auto listed = launchpad::async::wait(loop, serial.devices(std::nullopt));
                     require(listed.ok() && listed.value().size() == 1, "one board");
                     const auto &board = listed.value()[0];
                     require(board->id() == launchpad::backends::serial_device_id((dev / "ttyUSB0").string()),
                             "id derived from path");
                     require(board->name() == "esp32 (ttyUSB0)", "name from board and node");
                     require(board->ephemeral(), "boards are ephemeral");
                     require(board->platform_type() == launchpad::device::PlatformType::Custom, "custom platform");
                     const auto target = launchpad::async::wait(loop, board->target_platform());
                     require(target.ok() && target.value() == TargetPlatform::Tester, "tester target");

                     std::filesystem::remove(dev / "ttyUSB0");
                     touch(dev / "ttyACM0");
                     std::vector<std::string> removed;
                     serial.on_removed([&removed](const launchpad::device::DevicePtr &d) { removed.push_back(d->id()); });
                     const auto refreshed = launchpad::async::wait(loop, serial.discover_devices(Duration(1000), std::nullopt),
                                                                   Duration(2000));
                     require(refreshed.ok() && refreshed.value().size() == 1, "refresh sees the new node");
                     require(removed.size() == 1 && removed[0] == board->id(), "unplugged board removed");
                     std::filesystem::remove_all(dev);
                   }});

  tests.push_back({"backend_linux_and_web_server", [] {
                     EventLoop loop;
                     launchpad::backends::LinuxDiscovery linux_backend;
                     require(linux_backend.well_known_ids() == std::vector<std::string>({"linux"}), "linux well-known");
                     if (linux_backend.supports_platform()) {
                       const auto listed = launchpad::async::wait(loop, linux_backend.devices(std::nullopt));
                       require(listed.ok() && listed.value().size() == 1, "one desktop");
                       const auto &desktop = listed.value()[0];
                       require(desktop->id() == "linux" && desktop->name() == "Linux", "desktop identity");
                       require(!desktop->ephemeral(), "desktop is not ephemeral");
                       const auto again = launchpad::async::wait(loop, linux_backend.devices(std::nullopt));
                       require(again.value()[0] == desktop, "same device object each time");
                     }
                     require(launchpad::backends::linux_target_for_machine("aarch64") == TargetPlatform::LinuxArm64,
                             "aarch64");
                     require(launchpad::backends::linux_target_for_machine("x86_64") == TargetPlatform::LinuxX64,
                             "x86_64");

                     launchpad::backends::WebServerDiscovery web;
                     require(web.supports_platform() && web.can_list_anything(), "web server always available");
                     const auto listed = launchpad::async::wait(loop, web.discover_devices(std::nullopt, std::nullopt));
                     require(listed.ok() && ids_of(listed.value()) == std::vector<std::string>({"web-server"}),
                             "web server device");
                     const auto target = launchpad::async::wait(loop, listed.value()[0]->target_platform());
                     require(target.ok() && target.value() == TargetPlatform::WebJavascript, "web target");
                     require(listed.value()[0]->port_forwarder() != nullptr, "web server has a port forwarder");
                     listed.value()[0]->dispose();
                   }});
}
