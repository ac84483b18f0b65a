#pragma once

#include "launchpad/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace launchpad::common {

struct TomlValue {
  enum class Kind { String, Bool, Integer, Float, StringArray };

  Kind kind = Kind::String;
  std::string text;
  std::vector<std::string> items;
};

/// Flat view of a TOML document. Table headers are folded into dotted keys, so
/// `[discovery]\npolling_interval_ms = 10` is stored as `discovery.polling_interval_ms`.
struct TomlDocument {
  std::map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                        const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::int64_t get_int(const std::string &key, std::int64_t fallback) const;
  [[nodiscard]] std::vector<std::string> get_string_array(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(std::string_view text);

} // namespace launchpad::common
