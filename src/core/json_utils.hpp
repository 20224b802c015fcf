#ifndef BUGREPORTD_CORE_JSON_UTILS_HPP_
#define BUGREPORTD_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <string>
#include <string_view>

namespace bugreportd::core {

// Shared JSON string escaping for the session journal and config echo output.
inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 8U);
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
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
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(as_unsigned));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  return out;
}

// Emits `"key":"value"` with both sides escaped.
inline void AppendJsonStringMember(std::string& out, std::string_view key, std::string_view value) {
  out.push_back('"');
  out += EscapeJson(key);
  out += "\":\"";
  out += EscapeJson(value);
  out.push_back('"');
}

} // namespace bugreportd::core

#endif // BUGREPORTD_CORE_JSON_UTILS_HPP_
