#pragma once

#include <string>
#include <string_view>

namespace launchpad::common {

[[nodiscard]] std::string json_escape(std::string_view value);
[[nodiscard]] std::string json_quote(std::string_view value);
[[nodiscard]] inline const char *json_bool(const bool value) { return value ? "true" : "false"; }

} // namespace launchpad::common
