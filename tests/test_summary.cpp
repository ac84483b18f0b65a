#include "test_framework.hpp"

#include "fakes.hpp"

#include "launchpad/device/summary.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

using launchpad::device::Category;
using launchpad::device::DeviceSummary;
using launchpad::device::PlatformType;
using launchpad::device::TargetPlatform;
using launchpad::tests::FakeDeviceSpec;
using launchpad::tests::fake_device;

DeviceSummary summary_of(FakeDeviceSpec spec) {
  const auto future = launchpad::device::summarize(fake_device(std::move(spec)));
  launchpad::tests::require(future.is_ready() && future.result().ok(), "fake summaries settle at once");
  return future.result().value();
}

} // namespace

void register_summary_tests(std::vector<launchpad::tests::TestCase> &tests) {
  using launchpad::tests::require;

  tests.push_back({"summary_json_field_names", [] {
                     FakeDeviceSpec spec;
                     spec.id = "emulator-5554";
                     spec.name = "Pixel \"7\"";
                     spec.emulator = true;
                     spec.hardware_rendering = true;
                     spec.target = TargetPlatform::AndroidX64;
                     spec.sdk = "Android 14 (API 34)";
                     const auto json = launchpad::device::to_json(summary_of(spec));
                     require(json ==
                                 "{\"name\":\"Pixel \\\"7\\\"\",\"id\":\"emulator-5554\",\"isSupported\":true,"
                                 "\"targetPlatform\":\"android-x64\",\"emulator\":true,"
                                 "\"sdk\":\"Android 14 (API 34)\",\"capabilities\":{\"hotReload\":true,"
                                 "\"hotRestart\":true,\"screenshot\":false,\"fastStart\":false,"
                                 "\"cleanExit\":true,\"hardwareRendering\":true,\"startPaused\":true}}",
                             "unexpected json: " + json);
                   }});

  tests.push_back({"summary_hardware_rendering_requires_emulator", [] {
                     FakeDeviceSpec spec;
                     spec.id = "phone";
                     spec.hardware_rendering = true;
                     spec.emulator = false;
                     require(!summary_of(spec).hardware_rendering, "physical devices never report it");
                   }});

  tests.push_back({"summary_descriptions_align_columns", [] {
                     FakeDeviceSpec phone;
                     phone.id = "abc";
                     phone.name = "Phone";
                     phone.sdk = "Android 13";
                     FakeDeviceSpec simulator;
                     simulator.id = "sim-1234";
                     simulator.name = "iPhone";
                     simulator.category = Category::Mobile;
                     simulator.platform_type = PlatformType::Ios;
                     simulator.target = TargetPlatform::Ios;
                     simulator.emulator = true;
                     simulator.supported = false;
                     simulator.sdk = "iOS 17";

                     const auto lines =
                         launchpad::device::descriptions({summary_of(phone), summary_of(simulator)});
                     require(lines.size() == 2, "one line per device");
                     require(lines[0] == "Phone (mobile)  • abc      • android-arm64 • Android 13",
                             "unexpected first row: " + lines[0]);
                     require(lines[1] == "iPhone (mobile) • sim-1234 • ios           • iOS 17 (unsupported) (simulator)",
                             "unexpected second row: " + lines[1]);
                   }});

  tests.push_back({"summary_keeps_devices_whose_metadata_fails", [] {
                     FakeDeviceSpec broken;
                     broken.id = "flaky";
                     broken.name = "Flaky";
                     broken.metadata_error = "device went away";
                     const auto single = summary_of(broken);
                     require(single.target_platform == "unknown", "placeholder target platform");
                     require(single.sdk == "Unknown SDK", "placeholder sdk");

                     const auto all = launchpad::device::summarize_all({fake_device("ok"), fake_device(broken)});
                     require(all.is_ready() && all.result().ok(), "summaries settle at once");
                     require(all.result().value().size() == 2, "no device is dropped");
                     require(all.result().value()[1].id == "flaky", "order is kept");
                   }});

  tests.push_back({"summary_platform_types_sorted_unique", [] {
                     FakeDeviceSpec web;
                     web.id = "w";
                     web.platform_type = PlatformType::Web;
                     FakeDeviceSpec none;
                     none.id = "n";
                     none.platform_type = std::nullopt;
                     const auto types = launchpad::device::platform_types(
                         {fake_device("a"), fake_device(web), fake_device("b"), fake_device(none)});
                     require(types == std::vector<std::string>({"android", "null", "web"}),
                             "sorted, de-duplicated, null for unknown");
                   }});

  tests.push_back({"device_dispose_releases_log_reader_and_port_forwarder", [] {
                     FakeDeviceSpec spec;
                     spec.id = "phone";
                     const auto device = std::make_shared<launchpad::tests::FakeDevice>(spec);
                     require(device->log_reader()->name() == "phone", "log reader passed through");
                     require(device->port_forwarder()->name() == "phone", "port forwarder passed through");
                     device->dispose();
                     require(device->counting_log_reader().disposed == 1, "log reader released");
                     require(device->counting_port_forwarder().disposed == 1, "port forwarder released");
                   }});

  tests.push_back({"summary_identity_is_by_id", [] {
                     const auto first = fake_device("same", "Old name");
                     const auto second = fake_device("same", "New name");
                     require(*first == *second, "same id means same device");
                     require(*first != *fake_device("other"), "different id means different device");
                   }});
}
