#include "fim/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "pipelines/cleanup_pipeline.hpp"
#include "pipelines/hashing_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace fim::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitManifestInvalid =
    core::errors::ToInt(core::errors::ExitCode::kManifestInvalid);

enum class ValueFlag {
  kNone,
  kDirectory,
  kOutput,
  kMode,
  kLogLevel,
};

struct ValueFlagSpec {
  char short_name;
  std::string_view long_name;
  ValueFlag flag;
};

constexpr ValueFlagSpec kValueFlags[] = {
    {'d', "--directory", ValueFlag::kDirectory},
    {'o', "--output", ValueFlag::kOutput},
    {'m', "--mode", ValueFlag::kMode},
    {'\0', "--log-level", ValueFlag::kLogLevel},
};

struct FlagMatch {
  ValueFlag flag = ValueFlag::kNone;
  std::string display_name;
  std::optional<std::string_view> inline_value;
};

// Recognises `--name value`, `--name=value`, `-x value` and `-xvalue`.
FlagMatch MatchValueFlag(std::string_view token) {
  FlagMatch match;
  for (const auto& spec : kValueFlags) {
    const std::string_view long_name = spec.long_name;
    if (token == long_name) {
      match.flag = spec.flag;
      match.display_name = std::string(long_name);
      return match;
    }
    if (token.size() > long_name.size() && token.substr(0, long_name.size()) == long_name &&
        token[long_name.size()] == '=') {
      match.flag = spec.flag;
      match.display_name = std::string(long_name);
      match.inline_value = token.substr(long_name.size() + 1U);
      return match;
    }
    if (spec.short_name != '\0' && token.size() >= 2U && token[0] == '-' &&
        token[1] == spec.short_name) {
      match.flag = spec.flag;
      match.display_name = std::string(token.substr(0, 2));
      if (token.size() > 2U) {
        match.inline_value = token.substr(2);
      }
      return match;
    }
  }
  return match;
}

int CommandHashing(const Options& options, core::logging::Logger& logger) {
  logger.Info("hashing run requested",
              {{"directory", options.directory.string()},
               {"output", options.output_path.string()}});

  pipelines::HashingOptions hashing_options;
  hashing_options.directory = options.directory;
  hashing_options.manifest_path = options.output_path;

  pipelines::HashingSummary summary;
  std::string error;
  if (!pipelines::RunHashing(hashing_options, logger, std::cout, summary, error)) {
    logger.Error("hashing run failed",
                 {{"error", error},
                  {"records_appended", summary.files_hashed}});
    return summary.manifest.malformed_line != 0U ? kExitManifestInvalid : kExitFailure;
  }

  logger.Info("hashing run completed",
              {{"files_seen", summary.files_seen},
               {"files_hashed", summary.files_hashed},
               {"files_unchanged", summary.files_unchanged},
               {"bytes_hashed", summary.bytes_hashed}});
  return kExitSuccess;
}

int CommandCleanup(const Options& options, core::logging::Logger& logger) {
  logger.Info("cleanup run requested", {{"output", options.output_path.string()}});

  pipelines::CleanupOptions cleanup_options;
  cleanup_options.manifest_path = options.output_path;

  pipelines::CleanupSummary summary;
  std::string error;
  if (!pipelines::RunCleanup(cleanup_options, logger, std::cout, summary, error)) {
    logger.Error("cleanup run failed", {{"error", error}});
    return summary.manifest.malformed_line != 0U ? kExitManifestInvalid : kExitFailure;
  }

  if (summary.rewritten) {
    logger.Info("cleanup run completed",
                {{"records_read", summary.manifest.records_parsed},
                 {"records_kept", summary.records_kept},
                 {"entries_removed", summary.entries_removed},
                 {"duplicates_resolved", summary.duplicates_resolved}});
  }
  return kExitSuccess;
}

} // namespace

const char* ToString(Mode mode) {
  switch (mode) {
  case Mode::kHashing:
    return "hashing";
  case Mode::kCleanup:
    return "cleanup";
  case Mode::kNone:
    return "-";
  }
  return "-";
}

bool ParseMode(std::string_view raw, Mode& mode) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "hashing") {
    mode = Mode::kHashing;
    return true;
  }
  if (normalized == "cleanup") {
    mode = Mode::kCleanup;
    return true;
  }
  return false;
}

bool ParseOptions(const std::vector<std::string_view>& args, Options& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "-h" || token == "--help") {
      options.show_help = true;
      return true;
    }

    const FlagMatch match = MatchValueFlag(token);
    if (match.flag == ValueFlag::kNone) {
      if (token.size() > 1U && token.front() == '-') {
        error = "unknown option: " + std::string(token);
      } else {
        error = "unexpected argument: " + std::string(token);
      }
      return false;
    }

    std::string_view value;
    if (match.inline_value.has_value()) {
      value = match.inline_value.value();
    } else {
      if (i + 1 >= args.size()) {
        error = "missing value for " + match.display_name;
        return false;
      }
      value = args[i + 1];
      ++i;
    }
    if (value.empty()) {
      error = "missing value for " + match.display_name;
      return false;
    }

    switch (match.flag) {
    case ValueFlag::kDirectory:
      options.directory = fs::path(value);
      break;
    case ValueFlag::kOutput:
      options.output_path = fs::path(value);
      break;
    case ValueFlag::kMode:
      options.mode_text = std::string(value);
      if (!ParseMode(value, options.mode)) {
        options.mode = Mode::kNone;
      }
      break;
    case ValueFlag::kLogLevel: {
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      break;
    }
    case ValueFlag::kNone:
      break;
    }
  }

  return true;
}

bool ValidateOptions(const Options& options, std::string& error) {
  if (options.mode == Mode::kNone) {
    error = "The mode must be specified as either 'hashing' or 'cleanup'.";
    return false;
  }
  if (options.output_path.empty()) {
    error = "The output file must be specified.";
    return false;
  }
  if (options.mode == Mode::kHashing && options.directory.empty()) {
    error = "In hashing mode, the directory must be specified.";
    return false;
  }
  return true;
}

void PrintHelp(std::ostream& out) {
  out << "usage:\n"
      << "  fim -m hashing -d <directory> -o <file> [--log-level <debug|info|warn|error>]\n"
      << "  fim -m cleanup -o <file> [--log-level <debug|info|warn|error>]\n"
      << "\n"
      << "modes:\n"
      << "  hashing  Record the MD5 hash and size of every file under <directory> in <file>,\n"
      << "           one JSON object per line. Files whose size matches their latest record\n"
      << "           are not hashed again.\n"
      << "  cleanup  Rewrite <file> keeping only the latest record of each file that still\n"
      << "           exists; records of deleted files are dropped.\n"
      << "\n"
      << "options:\n"
      << "  -d, --directory DIRECTORY   Directory to process (hashing mode only).\n"
      << "  -o, --output FILE           Manifest file to update.\n"
      << "  -m, --mode MODE             \"hashing\" or \"cleanup\" (case-insensitive).\n"
      << "      --log-level LEVEL       Diagnostics threshold on stderr (default: info).\n"
      << "  -h, --help                  Print this help.\n"
      << "\n"
      << "examples:\n"
      << "  fim -d /path/to/directory -o /path/to/manifest.jsonl -m hashing\n"
      << "  fim -o /path/to/manifest.jsonl -m cleanup\n";
}

int Dispatch(int argc, char** argv) {
  std::vector<std::string_view> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  Options options;
  std::string error;
  if (!ParseOptions(args, options, error)) {
    std::cout << "error: " << error << '\n';
    PrintHelp(std::cout);
    return kExitUsage;
  }

  if (options.show_help) {
    PrintHelp(std::cout);
    return kExitSuccess;
  }

  if (!ValidateOptions(options, error)) {
    std::cout << error << '\n';
    PrintHelp(std::cout);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetMode(ToString(options.mode));

  if (options.mode == Mode::kHashing) {
    return CommandHashing(options, logger);
  }
  return CommandCleanup(options, logger);
}

} // namespace fim::cli
