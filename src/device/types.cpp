#include "launchpad/device/types.hpp"

#include <unordered_map>

namespace launchpad::device {

std::string to_string(const Category category) {
  switch (category) {
  case Category::Web:
    return "web";
  case Category::Desktop:
    return "desktop";
  case Category::Mobile:
    return "mobile";
  }
  return "unknown";
}

std::string to_string(const PlatformType platform_type) {
  switch (platform_type) {
  case PlatformType::Web:
    return "web";
  case PlatformType::Android:
    return "android";
  case PlatformType::Ios:
    return "ios";
  case PlatformType::Linux:
    return "linux";
  case PlatformType::Macos:
    return "macos";
  case PlatformType::Windows:
    return "windows";
  case PlatformType::Fuchsia:
    return "fuchsia";
  case PlatformType::Custom:
    return "custom";
  }
  return "unknown";
}

std::string to_string(const ConnectionInterface connection_interface) {
  return connection_interface == ConnectionInterface::Wireless ? "wireless" : "attached";
}

std::optional<Category> category_from_string(const std::string &value) {
  static const std::unordered_map<std::string, Category> known = {
      {"web", Category::Web},
      {"desktop", Category::Desktop},
      {"mobile", Category::Mobile},
  };
  const auto it = known.find(value);
  if (it == known.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<PlatformType> platform_type_from_string(const std::string &value) {
  static const std::unordered_map<std::string, PlatformType> known = {
      {"web", PlatformType::Web},         {"android", PlatformType::Android},
      {"ios", PlatformType::Ios},         {"linux", PlatformType::Linux},
      {"macos", PlatformType::Macos},     {"windows", PlatformType::Windows},
      {"fuchsia", PlatformType::Fuchsia}, {"custom", PlatformType::Custom},
  };
  const auto it = known.find(value);
  if (it == known.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string target_platform_name(const TargetPlatform platform) {
  switch (platform) {
  case TargetPlatform::Android:
    return "android";
  case TargetPlatform::AndroidArm:
    return "android-arm";
  case TargetPlatform::AndroidArm64:
    return "android-arm64";
  case TargetPlatform::AndroidX64:
    return "android-x64";
  case TargetPlatform::AndroidX86:
    return "android-x86";
  case TargetPlatform::Ios:
    return "ios";
  case TargetPlatform::Darwin:
    return "darwin";
  case TargetPlatform::LinuxX64:
    return "linux-x64";
  case TargetPlatform::LinuxArm64:
    return "linux-arm64";
  case TargetPlatform::WindowsX64:
    return "windows-x64";
  case TargetPlatform::WindowsArm64:
    return "windows-arm64";
  case TargetPlatform::FuchsiaArm64:
    return "fuchsia-arm64";
  case TargetPlatform::FuchsiaX64:
    return "fuchsia-x64";
  case TargetPlatform::Tester:
    return "tester";
  case TargetPlatform::WebJavascript:
    return "web-javascript";
  }
  return "unknown";
}

bool is_excluded_from_all(const TargetPlatform platform) {
  return platform == TargetPlatform::FuchsiaArm64 || platform == TargetPlatform::FuchsiaX64 ||
         platform == TargetPlatform::WebJavascript;
}

} // namespace launchpad::device
