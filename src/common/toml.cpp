#include "launchpad/common/toml.hpp"

#include "launchpad/common/fs.hpp"

#include <cctype>
#include <sstream>

namespace launchpad::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_string = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_string = !in_string;
    } else if (ch == '#' && !in_string) {
      return line.substr(0, i);
    }
  }
  return line;
}

Result<std::string> parse_quoted(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return Result<std::string>::failure("expected quoted string: " + raw);
  }
  std::string out;
  for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 2 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case '"':
    case '\\':
      out.push_back(next);
      break;
    default:
      out.push_back('\\');
      out.push_back(next);
      break;
    }
  }
  return Result<std::string>::success(std::move(out));
}

Result<std::vector<std::string>> parse_string_array(const std::string &raw) {
  const std::string body = trim(std::string_view(raw).substr(1, raw.size() - 2));
  std::vector<std::string> items;
  if (body.empty()) {
    return Result<std::vector<std::string>>::success(std::move(items));
  }

  std::size_t pos = 0;
  while (pos < body.size()) {
    while (pos < body.size() && (std::isspace(static_cast<unsigned char>(body[pos])) != 0 ||
                                 body[pos] == ',')) {
      ++pos;
    }
    if (pos >= body.size()) {
      break;
    }
    if (body[pos] != '"') {
      return Result<std::vector<std::string>>::failure("only string arrays are supported");
    }
    std::size_t end = pos + 1;
    while (end < body.size() && !(body[end] == '"' && body[end - 1] != '\\')) {
      ++end;
    }
    if (end >= body.size()) {
      return Result<std::vector<std::string>>::failure("unterminated string in array");
    }
    auto item = parse_quoted(body.substr(pos, end - pos + 1));
    if (!item.ok()) {
      return Result<std::vector<std::string>>::failure(item.error());
    }
    items.push_back(std::move(item.value()));
    pos = end + 1;
  }
  return Result<std::vector<std::string>>::success(std::move(items));
}

Result<TomlValue> parse_value(const std::string &raw) {
  TomlValue value;
  if (raw.empty()) {
    return Result<TomlValue>::failure("missing value");
  }
  if (raw.front() == '"') {
    auto text = parse_quoted(raw);
    if (!text.ok()) {
      return Result<TomlValue>::failure(text.error());
    }
    value.kind = TomlValue::Kind::String;
    value.text = std::move(text.value());
    return Result<TomlValue>::success(std::move(value));
  }
  if (raw.front() == '[') {
    if (raw.back() != ']') {
      return Result<TomlValue>::failure("unterminated array: " + raw);
    }
    auto items = parse_string_array(raw);
    if (!items.ok()) {
      return Result<TomlValue>::failure(items.error());
    }
    value.kind = TomlValue::Kind::StringArray;
    value.items = std::move(items.value());
    return Result<TomlValue>::success(std::move(value));
  }
  if (raw == "true" || raw == "false") {
    value.kind = TomlValue::Kind::Bool;
    value.text = raw;
    return Result<TomlValue>::success(std::move(value));
  }

  bool digits = true;
  bool dotted = false;
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch == '.') {
      dotted = true;
    } else if (!(std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '_' ||
                 (i == 0 && (ch == '-' || ch == '+')))) {
      digits = false;
    }
  }
  if (!digits) {
    return Result<TomlValue>::failure("unsupported value: " + raw);
  }
  value.kind = dotted ? TomlValue::Kind::Float : TomlValue::Kind::Integer;
  for (const char ch : raw) {
    if (ch != '_') {
      value.text.push_back(ch);
    }
  }
  return Result<TomlValue>::success(std::move(value));
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.find(key) != values.end(); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind == TomlValue::Kind::StringArray) {
    return fallback;
  }
  return it->second.text;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::Bool) {
    return fallback;
  }
  return it->second.text == "true";
}

std::int64_t TomlDocument::get_int(const std::string &key, const std::int64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::Integer) {
    return fallback;
  }
  try {
    return std::stoll(it->second.text);
  } catch (const std::exception &) {
    return fallback;
  }
}

std::vector<std::string> TomlDocument::get_string_array(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::StringArray) {
    return {};
  }
  return it->second.items;
}

Result<TomlDocument> parse_toml(std::string_view text) {
  TomlDocument doc;
  std::string section;
  std::istringstream stream{std::string(text)};
  std::string line;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string cleaned = trim(strip_comment(line));
    if (cleaned.empty()) {
      continue;
    }

    if (cleaned.front() == '[') {
      if (cleaned.back() != ']') {
        return Result<TomlDocument>::failure("line " + std::to_string(line_number) +
                                             ": malformed table header");
      }
      section = trim(std::string_view(cleaned).substr(1, cleaned.size() - 2));
      continue;
    }

    const auto eq = cleaned.find('=');
    if (eq == std::string::npos) {
      return Result<TomlDocument>::failure("line " + std::to_string(line_number) +
                                           ": expected key = value");
    }

    std::string key = trim(std::string_view(cleaned).substr(0, eq));
    if (key.size() >= 2 && key.front() == '"' && key.back() == '"') {
      key = key.substr(1, key.size() - 2);
    }
    if (key.empty()) {
      return Result<TomlDocument>::failure("line " + std::to_string(line_number) +
                                           ": empty key");
    }

    auto value = parse_value(trim(std::string_view(cleaned).substr(eq + 1)));
    if (!value.ok()) {
      return Result<TomlDocument>::failure("line " + std::to_string(line_number) + ": " +
                                           value.error());
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    doc.values[full_key] = std::move(value.value());
  }

  return Result<TomlDocument>::success(std::move(doc));
}

} // namespace launchpad::common
