#pragma once

#include "core/logging/logger.hpp"
#include "manifest/manifest_store.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>

namespace fim::pipelines {

struct CleanupOptions {
  std::filesystem::path manifest_path;
};

struct CleanupSummary {
  manifest::LoadStats manifest;
  std::uint64_t records_kept = 0;
  std::uint64_t entries_removed = 0;
  std::uint64_t duplicates_resolved = 0;
  bool rewritten = false;
};

// Cleanup mode.
//
// Drops every record whose path no longer exists and keeps only the last
// record of each surviving path, then rewrites the manifest with one line per
// path in first-seen order. The rewrite is atomic; a malformed line aborts
// before anything is written. A missing manifest is left missing.
//
// `progress` receives "Entry removed for deleted file <path>" for each dropped
// line and "Duplicate entry resolved for <path>" for each superseded one.
bool RunCleanup(const CleanupOptions& options, core::logging::Logger& logger,
                std::ostream& progress, CleanupSummary& summary, std::string& error);

} // namespace fim::pipelines
