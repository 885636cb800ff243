#include "core/json_dom.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace fim::core::json {

namespace {

constexpr std::size_t kMaxNesting = 64;

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsJsonWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

int HexDigitValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

void EncodeUtf8(std::uint32_t cp, std::string& out) {
  if (cp <= 0x7FU) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp <= 0x7FFU) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
  } else if (cp <= 0xFFFFU) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
  }
  out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
}

// Recursive-descent reader over a single buffer. Every Read* function leaves
// `pos` just past what it consumed and records the first failure in `error`.
struct Reader {
  std::string_view text;
  std::size_t pos = 0;
  std::string* error = nullptr;

  bool Done() const {
    return pos >= text.size();
  }

  bool Next(char c) const {
    return !Done() && text[pos] == c;
  }

  bool Accept(char c) {
    if (!Next(c)) {
      return false;
    }
    ++pos;
    return true;
  }

  void SkipSpace() {
    while (!Done() && IsJsonWhitespace(text[pos])) {
      ++pos;
    }
  }

  bool Error(std::string_view what) {
    *error = "parse error at column " + std::to_string(pos + 1U) + ": " + std::string(what);
    return false;
  }

  bool Expect(char c, std::string_view what) {
    return Accept(c) || Error(what);
  }

  std::size_t AcceptDigits() {
    const std::size_t start = pos;
    while (!Done() && IsDigit(text[pos])) {
      ++pos;
    }
    return pos - start;
  }

  bool ReadValue(Value& out, std::size_t depth) {
    if (depth > kMaxNesting) {
      return Error("nesting too deep");
    }
    SkipSpace();
    if (Done()) {
      return Error("unexpected end of input");
    }

    out = Value{};
    const char c = text[pos];
    switch (c) {
    case '{':
      out.type = Value::Type::kObject;
      return ReadObject(out.object_value, depth);
    case '[':
      out.type = Value::Type::kArray;
      return ReadArray(out.array_value, depth);
    case '"':
      out.type = Value::Type::kString;
      return ReadString(out.string_value);
    case 't':
      out.type = Value::Type::kBool;
      out.bool_value = true;
      return ReadKeyword("true");
    case 'f':
      out.type = Value::Type::kBool;
      return ReadKeyword("false");
    case 'n':
      return ReadKeyword("null");
    default:
      break;
    }
    if (c == '-' || IsDigit(c)) {
      out.type = Value::Type::kNumber;
      return ReadNumber(out);
    }
    return Error("expected a JSON value");
  }

  bool ReadKeyword(std::string_view word) {
    if (text.substr(pos, word.size()) != word) {
      return Error("expected a JSON value");
    }
    pos += word.size();
    return true;
  }

  bool ReadObject(Value::Object& members, std::size_t depth) {
    ++pos;
    SkipSpace();
    if (Accept('}')) {
      return true;
    }
    for (;;) {
      SkipSpace();
      if (!Next('"')) {
        return Error("expected string key");
      }
      std::string key;
      if (!ReadString(key)) {
        return false;
      }
      SkipSpace();
      if (!Expect(':', "expected ':' after key")) {
        return false;
      }
      Value member;
      if (!ReadValue(member, depth + 1U)) {
        return false;
      }
      members[std::move(key)] = std::move(member);

      SkipSpace();
      if (Accept('}')) {
        return true;
      }
      if (!Expect(',', "expected ',' or '}' after object member")) {
        return false;
      }
    }
  }

  bool ReadArray(Value::Array& items, std::size_t depth) {
    ++pos;
    SkipSpace();
    if (Accept(']')) {
      return true;
    }
    for (;;) {
      items.emplace_back();
      if (!ReadValue(items.back(), depth + 1U)) {
        return false;
      }
      SkipSpace();
      if (Accept(']')) {
        return true;
      }
      if (!Expect(',', "expected ',' or ']' after array element")) {
        return false;
      }
    }
  }

  bool ReadCodeUnit(std::uint32_t& unit) {
    if (text.size() - pos < 4U) {
      return Error("truncated \\u escape");
    }
    unit = 0;
    for (std::size_t i = 0; i < 4U; ++i) {
      const int digit = HexDigitValue(text[pos]);
      if (digit < 0) {
        return Error("bad hex digit in \\u escape");
      }
      unit = (unit << 4U) | static_cast<std::uint32_t>(digit);
      ++pos;
    }
    return true;
  }

  // Entered just after "\u".
  bool ReadUnicodeEscape(std::string& out) {
    std::uint32_t cp = 0;
    if (!ReadCodeUnit(cp)) {
      return false;
    }
    if (cp >= 0xDC00U && cp <= 0xDFFFU) {
      return Error("lone low surrogate in \\u escape");
    }
    if (cp >= 0xD800U && cp <= 0xDBFFU) {
      if (!Accept('\\') || !Accept('u')) {
        return Error("high surrogate without a following low surrogate");
      }
      std::uint32_t low = 0;
      if (!ReadCodeUnit(low)) {
        return false;
      }
      if (low < 0xDC00U || low > 0xDFFFU) {
        return Error("high surrogate without a following low surrogate");
      }
      cp = 0x10000U + (((cp - 0xD800U) << 10U) | (low - 0xDC00U));
    }
    EncodeUtf8(cp, out);
    return true;
  }

  bool ReadString(std::string& out) {
    ++pos;
    out.clear();
    while (!Done()) {
      const char c = text[pos++];
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        --pos;
        return Error("raw control character in string");
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (Done()) {
        break;
      }
      const char escaped = text[pos++];
      switch (escaped) {
      case '"':
      case '\\':
      case '/':
        out.push_back(escaped);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!ReadUnicodeEscape(out)) {
          return false;
        }
        break;
      default:
        --pos;
        return Error("unknown escape sequence");
      }
    }
    return Error("unterminated string");
  }

  // Grammar: -? (0 | [1-9][0-9]*) (. [0-9]+)? ([eE] [+-]? [0-9]+)?
  bool ReadNumber(Value& out) {
    const std::size_t start = pos;
    Accept('-');
    if (!Accept('0') && AcceptDigits() == 0U) {
      return Error("expected digit");
    }
    if (Accept('.') && AcceptDigits() == 0U) {
      return Error("expected digit after '.'");
    }
    if (Accept('e') || Accept('E')) {
      if (!Accept('+')) {
        Accept('-');
      }
      if (AcceptDigits() == 0U) {
        return Error("expected exponent digit");
      }
    }

    out.number_text.assign(text.substr(start, pos - start));
    out.number_value = std::strtod(out.number_text.c_str(), nullptr);
    return true;
  }
};

std::string FieldError(std::string_view key, std::string_view problem) {
  return "field '" + std::string(key) + "' " + std::string(problem);
}

} // namespace

bool Parse(std::string_view text, Value& root, std::string& error) {
  Reader reader{text, 0, &error};
  if (!reader.ReadValue(root, 0)) {
    return false;
  }
  reader.SkipSpace();
  if (!reader.Done()) {
    return reader.Error("trailing content after JSON value");
  }
  return true;
}

const Value* FindField(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  return it == object.object_value.end() ? nullptr : &it->second;
}

bool GetStringField(const Value& object, std::string_view key, std::string& output,
                    std::string& error) {
  const Value* field = FindField(object, key);
  if (field == nullptr) {
    error = FieldError(key, "is missing");
    return false;
  }
  if (field->type != Value::Type::kString) {
    error = FieldError(key, "must be a string");
    return false;
  }
  output = field->string_value;
  return true;
}

bool GetUnsignedField(const Value& object, std::string_view key, std::uint64_t& output,
                      std::string& error) {
  const Value* field = FindField(object, key);
  if (field == nullptr) {
    error = FieldError(key, "is missing");
    return false;
  }
  if (field->type != Value::Type::kNumber) {
    error = FieldError(key, "must be a number");
    return false;
  }

  const std::string& digits = field->number_text;
  const char* const last = digits.data() + digits.size();
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), last, parsed);
  if (ec == std::errc::result_out_of_range) {
    error = FieldError(key, "is out of range: " + digits);
    return false;
  }
  if (ec != std::errc() || ptr != last) {
    error = FieldError(key, "must be a non-negative integer: " + digits);
    return false;
  }
  output = parsed;
  return true;
}

} // namespace fim::core::json
