#pragma once

#include "launchpad/device/types.hpp"

#include <filesystem>
#include <memory>
#include <set>

namespace launchpad::device {

/// The application project a deployment is run from, reduced to the platform folders it
/// carries. A project without an `android/` folder cannot be deployed to Android devices.
class ProjectContext {
public:
  ProjectContext(std::filesystem::path root, std::set<PlatformType> platforms);

  [[nodiscard]] static std::shared_ptr<const ProjectContext> scan(const std::filesystem::path &root);
  [[nodiscard]] static std::shared_ptr<const ProjectContext> current();

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] const std::set<PlatformType> &platforms() const { return platforms_; }
  [[nodiscard]] bool supports(PlatformType platform) const;

private:
  std::filesystem::path root_;
  std::set<PlatformType> platforms_;
};

} // namespace launchpad::device
