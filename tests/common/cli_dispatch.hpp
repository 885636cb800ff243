#ifndef FIM_TESTS_COMMON_CLI_DISPATCH_HPP_
#define FIM_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "fim/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fim::tests::common {

struct DispatchResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
};

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return fim::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Runs the CLI in-process with stdout and stderr captured.
inline DispatchResult DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::ostringstream captured_cout;
  std::ostringstream captured_cerr;
  std::streambuf* original_cout = std::cout.rdbuf(captured_cout.rdbuf());
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_cerr.rdbuf());

  DispatchResult result;
  result.exit_code = DispatchArgs(argv_storage);

  std::cout.rdbuf(original_cout);
  std::cerr.rdbuf(original_cerr);
  result.stdout_text = captured_cout.str();
  result.stderr_text = captured_cerr.str();
  return result;
}

} // namespace fim::tests::common

#endif // FIM_TESTS_COMMON_CLI_DISPATCH_HPP_
