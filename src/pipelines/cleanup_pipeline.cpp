#include "pipelines/cleanup_pipeline.hpp"

#include <system_error>
#include <unordered_map>

namespace fs = std::filesystem;

namespace fim::pipelines {

namespace {

// Memoised existence checks; a path listed many times is stat'ed once.
class ExistenceCache {
public:
  bool Exists(const std::string& file, bool& exists, std::string& error) {
    const auto it = cache_.find(file);
    if (it != cache_.end()) {
      exists = it->second;
      return true;
    }

    std::error_code ec;
    exists = fs::exists(fs::path(file), ec);
    if (ec) {
      error = "failed to check existence of '" + file + "': " + ec.message();
      return false;
    }
    cache_.emplace(file, exists);
    return true;
  }

private:
  std::unordered_map<std::string, bool> cache_;
};

} // namespace

bool RunCleanup(const CleanupOptions& options, core::logging::Logger& logger,
                std::ostream& progress, CleanupSummary& summary, std::string& error) {
  summary = CleanupSummary{};

  if (options.manifest_path.empty()) {
    error = "manifest path cannot be empty";
    return false;
  }

  manifest::ManifestIndex survivors;
  ExistenceCache existence;
  std::uint64_t removed = 0;
  std::uint64_t duplicates = 0;

  const bool read_ok = manifest::ReadManifestRecords(
      options.manifest_path,
      [&](const manifest::ManifestRecord& record, std::size_t line_number, std::string& visit_error) {
        bool exists = false;
        if (!existence.Exists(record.file, exists, visit_error)) {
          return false;
        }

        if (!exists) {
          ++removed;
          progress << "Entry removed for deleted file " << record.file << '\n';
          logger.Debug("dropping record for missing file",
                       {{"file", record.file}, {"line", line_number}});
          return true;
        }

        if (survivors.Upsert(record)) {
          ++duplicates;
          progress << "Duplicate entry resolved for " << record.file << '\n';
          logger.Debug("later record supersedes earlier one",
                       {{"file", record.file}, {"line", line_number}});
        }
        return true;
      },
      summary.manifest, error);
  progress.flush();

  summary.entries_removed = removed;
  summary.duplicates_resolved = duplicates;
  if (!read_ok) {
    return false;
  }

  // An absent manifest is not created. Compacting nothing into a new file
  // would only hide a mistyped -o path.
  if (!summary.manifest.file_present) {
    logger.Warn("manifest not found, nothing to clean",
                {{"path", options.manifest_path.string()}});
    return true;
  }

  if (!manifest::WriteManifest(survivors.Records(), options.manifest_path, error)) {
    return false;
  }
  summary.records_kept = survivors.Size();
  summary.rewritten = true;
  return true;
}

} // namespace fim::pipelines
