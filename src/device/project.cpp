#include "launchpad/device/project.hpp"

#include <array>
#include <utility>

namespace launchpad::device {

ProjectContext::ProjectContext(std::filesystem::path root, std::set<PlatformType> platforms)
    : root_(std::move(root)), platforms_(std::move(platforms)) {}

std::shared_ptr<const ProjectContext> ProjectContext::scan(const std::filesystem::path &root) {
  static const std::array<PlatformType, 7> candidates = {
      PlatformType::Android, PlatformType::Ios,     PlatformType::Linux,  PlatformType::Macos,
      PlatformType::Windows, PlatformType::Web,     PlatformType::Fuchsia,
  };

  std::set<PlatformType> found;
  std::error_code ec;
  for (const auto platform : candidates) {
    if (std::filesystem::is_directory(root / to_string(platform), ec)) {
      found.insert(platform);
    }
  }
  return std::make_shared<const ProjectContext>(root, std::move(found));
}

std::shared_ptr<const ProjectContext> ProjectContext::current() {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    cwd = ".";
  }
  return scan(cwd);
}

bool ProjectContext::supports(const PlatformType platform) const {
  // Custom targets are configured outside the project tree.
  if (platform == PlatformType::Custom) {
    return true;
  }
  return platforms_.count(platform) > 0;
}

} // namespace launchpad::device
