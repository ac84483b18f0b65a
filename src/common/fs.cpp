#include "launchpad/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace launchpad::common {

std::string trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}

std::string to_lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

std::vector<std::string> split_whitespace(std::string_view value) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < value.size()) {
    while (i < value.size() && std::isspace(static_cast<unsigned char>(value[i])) != 0) {
      ++i;
    }
    const std::size_t start = i;
    while (i < value.size() && std::isspace(static_cast<unsigned char>(value[i])) == 0) {
      ++i;
    }
    if (i > start) {
      out.emplace_back(value.substr(start, i - start));
    }
  }
  return out;
}

std::string join(const std::vector<std::string> &parts, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += separator;
    }
    out += parts[i];
  }
  return out;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

std::string expand_path(const std::string &path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  const auto home = home_dir();
  if (!home.ok()) {
    return path;
  }
  if (path.size() == 1) {
    return home.value().string();
  }
  if (path[1] == '/') {
    return (home.value() / path.substr(2)).string();
  }
  return path;
}

} // namespace launchpad::common
