#pragma once

namespace fim::core::errors {

// Process-exit contract for scripts wrapping `fim`.
//
// Usage errors keep the conventional 1 that existing wrappers already check
// for. Runtime failures are split so a corrupt manifest can be told apart
// from an I/O problem without scraping output text.
enum class ExitCode : int {
  kSuccess = 0,
  kUsage = 1,
  kFailure = 2,
  kManifestInvalid = 10,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace fim::core::errors
