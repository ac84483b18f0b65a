#include "launchpad/device/summary.hpp"

#include "launchpad/common/json_util.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <sstream>

namespace launchpad::device {

namespace {

using SummaryPtr = std::shared_ptr<DeviceSummary>;

constexpr const char *UNKNOWN_TARGET_PLATFORM = "unknown";
constexpr const char *UNKNOWN_SDK = "Unknown SDK";

template <typename T> async::Future<std::optional<T>> or_missing(const async::Future<T> &source) {
  return async::map_result<std::optional<T>>(source, [](const common::Result<T> &result) {
    return common::Result<std::optional<T>>::success(result.ok() ? std::optional<T>(result.value())
                                                                 : std::nullopt);
  });
}

async::Future<DeviceSummary> finish_with_rendering(const DevicePtr &device,
                                                   const SummaryPtr &summary) {
  if (!summary->emulator) {
    summary->hardware_rendering = false;
    return async::Future<DeviceSummary>::ready(*summary);
  }
  return async::map_result<DeviceSummary>(
      device->supports_hardware_rendering(), [summary](const common::Result<bool> &rendering) {
        summary->hardware_rendering = rendering.ok() && rendering.value();
        return common::Result<DeviceSummary>::success(*summary);
      });
}

std::string pad_right(const std::string &value, const std::size_t width) {
  if (value.size() >= width) {
    return value;
  }
  return value + std::string(width - value.size(), ' ');
}

} // namespace

async::Future<DeviceSummary> summarize(const DevicePtr &device) {
  auto summary = std::make_shared<DeviceSummary>();
  summary->name = device->name();
  summary->id = device->id();
  summary->category = device->category();
  summary->supported = device->is_supported();
  summary->capabilities = device->capabilities();

  // A device that cannot answer still gets listed, with placeholders.
  return async::flat_map<DeviceSummary>(
      or_missing(device->target_platform()),
      [device, summary](const std::optional<TargetPlatform> &platform) {
        if (platform.has_value()) {
          summary->target = *platform;
          summary->target_platform = target_platform_name(*platform);
        } else {
          summary->target_platform = UNKNOWN_TARGET_PLATFORM;
        }
        return async::flat_map<DeviceSummary>(
            or_missing(device->is_local_emulator()),
            [device, summary](const std::optional<bool> &emulator) {
              summary->emulator = emulator.value_or(false);
              return async::flat_map<DeviceSummary>(
                  or_missing(device->sdk_name_and_version()),
                  [device, summary](const std::optional<std::string> &sdk) {
                    summary->sdk = sdk.value_or(UNKNOWN_SDK);
                    return finish_with_rendering(device, summary);
                  });
            });
      });
}

async::Future<std::vector<DeviceSummary>> summarize_all(const DeviceList &devices) {
  std::vector<async::Future<DeviceSummary>> pending;
  pending.reserve(devices.size());
  for (const auto &device : devices) {
    pending.push_back(summarize(device));
  }
  return async::map_result<std::vector<DeviceSummary>>(
      async::when_all(pending),
      [](const common::Result<std::vector<common::Result<DeviceSummary>>> &settled) {
        std::vector<DeviceSummary> out;
        if (settled.ok()) {
          for (const auto &item : settled.value()) {
            if (item.ok()) {
              out.push_back(item.value());
            }
          }
        }
        return common::Result<std::vector<DeviceSummary>>::success(std::move(out));
      });
}

std::string to_json(const DeviceSummary &summary) {
  std::ostringstream out;
  out << "{\"name\":" << common::json_quote(summary.name)
      << ",\"id\":" << common::json_quote(summary.id)
      << ",\"isSupported\":" << common::json_bool(summary.supported)
      << ",\"targetPlatform\":" << common::json_quote(summary.target_platform)
      << ",\"emulator\":" << common::json_bool(summary.emulator)
      << ",\"sdk\":" << common::json_quote(summary.sdk) << ",\"capabilities\":{"
      << "\"hotReload\":" << common::json_bool(summary.capabilities.hot_reload)
      << ",\"hotRestart\":" << common::json_bool(summary.capabilities.hot_restart)
      << ",\"screenshot\":" << common::json_bool(summary.capabilities.screenshot)
      << ",\"fastStart\":" << common::json_bool(summary.capabilities.fast_start)
      << ",\"cleanExit\":" << common::json_bool(summary.capabilities.clean_exit)
      << ",\"hardwareRendering\":" << common::json_bool(summary.hardware_rendering)
      << ",\"startPaused\":" << common::json_bool(summary.capabilities.start_paused) << "}}";
  return out.str();
}

std::string to_json(const std::vector<DeviceSummary> &summaries) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < summaries.size(); ++i) {
    out << (i == 0 ? "\n  " : ",\n  ") << to_json(summaries[i]);
  }
  out << (summaries.empty() ? "]" : "\n]");
  return out.str();
}

std::vector<std::string> descriptions(const std::vector<DeviceSummary> &summaries) {
  if (summaries.empty()) {
    return {};
  }

  std::vector<std::vector<std::string>> table;
  table.reserve(summaries.size());
  for (const auto &summary : summaries) {
    std::string support_indicator = summary.supported ? "" : " (unsupported)";
    if (summary.emulator) {
      support_indicator += summary.target == TargetPlatform::Ios ? " (simulator)" : " (emulator)";
    }
    const std::string category =
        summary.category.has_value() ? to_string(*summary.category) : "null";
    table.push_back({summary.name + " (" + category + ")", summary.id, summary.target_platform,
                     summary.sdk + support_indicator});
  }

  // The last column is left unpadded.
  const std::size_t padded_columns = table.front().size() - 1;
  std::vector<std::size_t> widths(padded_columns, 0);
  for (const auto &row : table) {
    for (std::size_t i = 0; i < padded_columns; ++i) {
      widths[i] = std::max(widths[i], row[i].size());
    }
  }

  std::vector<std::string> lines;
  lines.reserve(table.size());
  for (const auto &row : table) {
    std::string line;
    for (std::size_t i = 0; i < padded_columns; ++i) {
      line += pad_right(row[i], widths[i]) + " • ";
    }
    line += row.back();
    lines.push_back(std::move(line));
  }
  return lines;
}

} // namespace launchpad::device
