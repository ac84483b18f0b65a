#pragma once

#include "launchpad/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace launchpad::common {

[[nodiscard]] std::string trim(std::string_view value);
[[nodiscard]] std::string to_lower(std::string_view value);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, std::string_view separator);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(const std::string &path);

} // namespace launchpad::common
