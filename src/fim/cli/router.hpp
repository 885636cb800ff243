#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fim::cli {

enum class Mode {
  kNone,
  kHashing,
  kCleanup,
};

const char* ToString(Mode mode);

// Case-insensitive; returns false for anything but "hashing"/"cleanup".
bool ParseMode(std::string_view raw, Mode& mode);

// Everything one invocation is configured with. There are no config files or
// environment lookups; this struct is the whole configuration surface.
struct Options {
  std::filesystem::path directory;
  std::filesystem::path output_path;
  Mode mode = Mode::kNone;
  // Raw mode text as given, kept for diagnostics when it does not parse.
  std::string mode_text;
  bool show_help = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Parses flags left to right. `-h/--help` stops parsing and sets
// `show_help`. Unknown flags, missing values and stray positional arguments
// are errors. Mode/output/directory requirements are not checked here.
bool ParseOptions(const std::vector<std::string_view>& args, Options& options, std::string& error);

// Checks the per-mode requirements in order (mode, output, directory) and
// returns the first violation as a user-facing sentence.
bool ValidateOptions(const Options& options, std::string& error);

// Full help text, printed for -h and after every usage error.
void PrintHelp(std::ostream& out);

// Entry point for the `fim` binary. Exit codes:
//   0  => success or --help
//   1  => usage error (message and help on stdout)
//   2  => filesystem / I/O failure during the run
//   10 => manifest contains a malformed record
int Dispatch(int argc, char** argv);

} // namespace fim::cli
