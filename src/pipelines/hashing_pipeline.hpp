#pragma once

#include "core/logging/logger.hpp"
#include "manifest/manifest_store.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace fim::pipelines {

struct HashingOptions {
  std::filesystem::path directory;
  std::filesystem::path manifest_path;
};

struct HashingSummary {
  manifest::LoadStats manifest;
  std::uint64_t files_seen = 0;
  std::uint64_t files_hashed = 0;
  std::uint64_t files_unchanged = 0;
  std::uint64_t bytes_hashed = 0;
};

// Lists every regular file below `directory` (symlinks resolving to regular
// files included, symlinked directories not descended), sorted by path. Paths
// keep the `directory` prefix as given.
bool CollectRegularFiles(const std::filesystem::path& directory,
                         std::vector<std::filesystem::path>& files, std::string& error);

// Hashing mode.
//
// Loads the manifest, then appends a record for every file that is new or
// whose size differs from its latest record. Files whose size matches are not
// re-read, so a same-size content change goes unnoticed.
//
// `progress` receives one "Processing <path>..." line per hashed file.
// Records are appended one by one; on failure the ones already written stay.
bool RunHashing(const HashingOptions& options, core::logging::Logger& logger,
                std::ostream& progress, HashingSummary& summary, std::string& error);

} // namespace fim::pipelines
