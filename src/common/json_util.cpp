#include "launchpad/common/json_util.hpp"

#include <cstdio>

namespace launchpad::common {

std::string json_escape(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  return out;
}

std::string json_quote(std::string_view value) { return "\"" + json_escape(value) + "\""; }

} // namespace launchpad::common
