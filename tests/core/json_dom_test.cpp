#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>

using fim::core::json::Value;

TEST_CASE("Parser reads flat objects with typed fields", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(fim::core::json::Parse(R"({"name":"a.txt","size":12,"ok":true,"none":null})", root,
                                 error));
  REQUIRE(root.type == Value::Type::kObject);
  REQUIRE(root.object_value.at("name").string_value == "a.txt");
  REQUIRE(root.object_value.at("size").number_text == "12");
  REQUIRE(root.object_value.at("ok").bool_value);
  REQUIRE(root.object_value.at("none").type == Value::Type::kNull);
}

TEST_CASE("Parser decodes unicode escapes to UTF-8", "[core][json]") {
  Value root;
  std::string error;

  REQUIRE(fim::core::json::Parse(R"("caf\u00e9")", root, error));
  REQUIRE(root.string_value == "caf\xC3\xA9");

  REQUIRE(fim::core::json::Parse(R"("\u0001\u001f")", root, error));
  REQUIRE(root.string_value == std::string("\x01\x1f"));

  // U+1F600 as a surrogate pair.
  REQUIRE(fim::core::json::Parse(R"("\ud83d\ude00")", root, error));
  REQUIRE(root.string_value == "\xF0\x9F\x98\x80");
}

TEST_CASE("Parser bounds nesting depth", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(fim::core::json::Parse(std::string(64, '[') + std::string(64, ']'), root, error));
  REQUIRE_FALSE(fim::core::json::Parse(std::string(70, '[') + std::string(70, ']'), root, error));
  REQUIRE(error.find("nesting too deep") != std::string::npos);
}

TEST_CASE("Parser rejects broken unicode escapes", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(fim::core::json::Parse(R"("\u12")", root, error));
  REQUIRE_FALSE(fim::core::json::Parse(R"("\uzzzz")", root, error));
  REQUIRE_FALSE(fim::core::json::Parse(R"("\ud83d")", root, error));
  REQUIRE_FALSE(fim::core::json::Parse(R"("\ude00")", root, error));
}

TEST_CASE("Parser reports the column of failures", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(fim::core::json::Parse(R"({"file":"a" "md5":"b"})", root, error));
  REQUIRE(error == "parse error at column 13: expected ',' or '}' after object member");

  REQUIRE_FALSE(fim::core::json::Parse(R"({"file":"a"} extra)", root, error));
  REQUIRE(error.find("trailing content") != std::string::npos);
}

TEST_CASE("Unsigned field access keeps full 64-bit precision", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(fim::core::json::Parse(R"({"size":18446744073709551615})", root, error));

  std::uint64_t size = 0;
  REQUIRE(fim::core::json::GetUnsignedField(root, "size", size, error));
  REQUIRE(size == UINT64_MAX);
}

TEST_CASE("Unsigned field access rejects non-integers", "[core][json]") {
  std::string error;
  std::uint64_t size = 0;

  const char* rejected[] = {
      R"({"size":-1})",
      R"({"size":1.5})",
      R"({"size":1e3})",
      R"({"size":"12"})",
      R"({"size":18446744073709551616})",
      R"({"other":1})",
  };
  for (const char* text : rejected) {
    Value root;
    REQUIRE(fim::core::json::Parse(text, root, error));
    REQUIRE_FALSE(fim::core::json::GetUnsignedField(root, "size", size, error));
    REQUIRE(error.find("size") != std::string::npos);
  }
}

TEST_CASE("AppendJsonString escapes only what JSON requires", "[core][json]") {
  std::string out;
  fim::core::AppendJsonString(out, "dir/\"q\"\\\n\t\x01\xC3\xA9");
  REQUIRE(out == "\"dir/\\\"q\\\"\\\\\\n\\t\\u0001\xC3\xA9\"");
}
