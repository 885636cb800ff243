#ifndef FIM_CORE_JSON_DOM_HPP_
#define FIM_CORE_JSON_DOM_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fim::core::json {

// Minimal STL-only document model for manifest lines.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  // Token exactly as written. Byte counts above 2^53 do not survive a
  // double, so integer fields are decoded from this.
  std::string number_text;
  bool bool_value = false;
};

// Parses one complete JSON document. Errors carry the 1-based column of the
// offending character, e.g. "parse error at column 12: expected ':'".
bool Parse(std::string_view text, Value& root, std::string& error);

const Value* FindField(const Value& object, std::string_view key);

// Typed accessors for flat objects. Each fails with `error` naming the key
// when the field is absent or has the wrong shape.
bool GetStringField(const Value& object, std::string_view key, std::string& output,
                    std::string& error);
bool GetUnsignedField(const Value& object, std::string_view key, std::uint64_t& output,
                      std::string& error);

} // namespace fim::core::json

#endif // FIM_CORE_JSON_DOM_HPP_
