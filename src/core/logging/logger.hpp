#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace fim::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* ToString(LogLevel level);

// Accepts debug|info|warn|warning|error in any case.
bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error);

// One key=value pair. Text and paths are quoted on output; counters are
// written bare so log scrapers can read them as numbers.
struct LogField {
  LogField(std::string_view field_key, std::string_view text)
      : key(field_key), value(text), quoted(true) {}
  LogField(std::string_view field_key, const char* text)
      : key(field_key), value(text), quoted(true) {}
  LogField(std::string_view field_key, const std::string& text)
      : key(field_key), value(text), quoted(true) {}
  LogField(std::string_view field_key, const std::filesystem::path& path)
      : key(field_key), value(path.generic_string()), quoted(true) {}
  template <typename Unsigned,
            typename = std::enable_if_t<std::is_integral_v<Unsigned> &&
                                        std::is_unsigned_v<Unsigned> &&
                                        !std::is_same_v<Unsigned, bool>>>
  LogField(std::string_view field_key, Unsigned number)
      : key(field_key), value(std::to_string(static_cast<std::uint64_t>(number))),
        quoted(false) {}
  LogField(std::string_view field_key, bool flag)
      : key(field_key), value(flag ? "true" : "false"), quoted(false) {}

  std::string_view key;
  std::string value;
  bool quoted;
};

// Single-line diagnostics for operators:
//   ts_utc=<iso8601> level=<LEVEL> mode="<mode>" msg="<text>" key=value...
// Human progress text goes to stdout separately; this sink defaults to stderr.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  // Tags every line with the pipeline being executed.
  void SetMode(std::string mode) {
    mode_ = std::move(mode);
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message, std::initializer_list<LogField> fields = {});

  void Debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string mode_ = "-";
};

// Exposed for tests: UTC with millisecond precision, e.g. 1970-01-01T00:00:02.000Z.
std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts);

} // namespace fim::core::logging
