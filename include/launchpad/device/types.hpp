#pragma once

#include <optional>
#include <string>

namespace launchpad::device {

enum class Category { Web, Desktop, Mobile };

enum class PlatformType { Web, Android, Ios, Linux, Macos, Windows, Fuchsia, Custom };

enum class TargetPlatform {
  Android,
  AndroidArm,
  AndroidArm64,
  AndroidX64,
  AndroidX86,
  Ios,
  Darwin,
  LinuxX64,
  LinuxArm64,
  WindowsX64,
  WindowsArm64,
  FuchsiaArm64,
  FuchsiaX64,
  Tester,
  WebJavascript,
};

enum class ConnectionInterface { Attached, Wireless };

[[nodiscard]] std::string to_string(Category category);
[[nodiscard]] std::string to_string(PlatformType platform_type);
[[nodiscard]] std::string to_string(ConnectionInterface connection_interface);

[[nodiscard]] std::optional<Category> category_from_string(const std::string &value);
[[nodiscard]] std::optional<PlatformType> platform_type_from_string(const std::string &value);

[[nodiscard]] std::string target_platform_name(TargetPlatform platform);

/// Web and fuchsia targets cannot share the aggregate execution pipeline used by "all".
[[nodiscard]] bool is_excluded_from_all(TargetPlatform platform);

} // namespace launchpad::device
