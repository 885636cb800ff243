#include "core/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace fim::core::logging {

namespace {

constexpr std::string_view kExpectedLevels = "debug|info|warn|error";

void WriteQuoted(std::ostream& out, std::string_view raw) {
  out << '"';
  for (const char c : raw) {
    switch (c) {
    case '\\':
      out << "\\\\";
      break;
    case '"':
      out << "\\\"";
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
      out << c;
      break;
    }
  }
  out << '"';
}

} // namespace

const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }
  return "INFO";
}

bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  if (raw.empty()) {
    error = "missing value for --log-level (expected " + std::string(kExpectedLevels) + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
  } else if (normalized == "info") {
    level = LogLevel::kInfo;
  } else if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
  } else if (normalized == "error") {
    level = LogLevel::kError;
  } else {
    error = "invalid --log-level '" + std::string(raw) + "' (expected " +
            std::string(kExpectedLevels) + ")";
    return false;
  }
  return true;
}

std::string FormatUtcTimestamp(std::chrono::system_clock::time_point ts) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
  const int millis = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(ts);
  std::tm utc_time{};
#if defined(_WIN32)
  if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }
#endif

  char seconds_part[32];
  if (std::strftime(seconds_part, sizeof(seconds_part), "%Y-%m-%dT%H:%M:%S", &utc_time) == 0U) {
    return "";
  }
  char full[40];
  std::snprintf(full, sizeof(full), "%s.%03dZ", seconds_part, millis);
  return full;
}

void Logger::Log(LogLevel level, std::string_view message,
                 std::initializer_list<LogField> fields) {
  if (!ShouldLog(level)) {
    return;
  }

  std::ostream& out = *out_;
  out << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
      << " level=" << ToString(level) << " mode=";
  WriteQuoted(out, mode_);
  out << " msg=";
  WriteQuoted(out, message);

  for (const auto& field : fields) {
    out << ' ' << field.key << '=';
    if (field.quoted) {
      WriteQuoted(out, field.value);
    } else {
      out << field.value;
    }
  }

  out << '\n';
  out.flush();
}

} // namespace fim::core::logging
