#ifndef STALLWATCH_CORE_JSON_UTILS_HPP_
#define STALLWATCH_CORE_JSON_UTILS_HPP_

#include <cstddef>
#include <cstdio>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace stallwatch::core {

// Writes `value` as a quoted JSON string. Control characters without a short
// escape are written as \u00XX.
inline void WriteJsonString(std::ostream& out, std::string_view value) {
  out << '"';
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[7] = {};
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        out << buffer;
      } else {
        out << ch;
      }
      break;
    }
  }
  out << '"';
}

// Writes `values` as a JSON array of strings, keeping their order.
inline void WriteJsonStringArray(std::ostream& out, const std::vector<std::string>& values) {
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    WriteJsonString(out, values[i]);
  }
  out << ']';
}

} // namespace stallwatch::core

#endif // STALLWATCH_CORE_JSON_UTILS_HPP_
