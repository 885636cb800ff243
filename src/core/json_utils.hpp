#ifndef FIM_CORE_JSON_UTILS_HPP_
#define FIM_CORE_JSON_UTILS_HPP_

#include <string>
#include <string_view>

namespace fim::core {

// Appends `input` to `out` as a quoted JSON string. Only the characters JSON
// requires are escaped; non-ASCII bytes pass through so UTF-8 paths stay
// readable in the manifest.
inline void AppendJsonString(std::string& out, std::string_view input) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  out.push_back('"');
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
        out += "\\u00";
        out.push_back(kHexDigits[as_unsigned >> 4U]);
        out.push_back(kHexDigits[as_unsigned & 0x0FU]);
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  out.push_back('"');
}

} // namespace fim::core

#endif // FIM_CORE_JSON_UTILS_HPP_
