#include "pipelines/hashing_pipeline.hpp"

#include "core/hash/md5.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace fim::pipelines {

namespace {

// Resolves symlinks the way a plain "is this a file" test does. A dangling
// link is simply not a regular file; any other stat failure is an error.
bool IsRegularFile(const fs::path& path, bool& is_regular, std::string& error) {
  std::error_code ec;
  const fs::file_status status = fs::status(path, ec);
  if (status.type() == fs::file_type::not_found) {
    is_regular = false;
    return true;
  }
  if (ec) {
    error = "failed to stat '" + path.string() + "': " + ec.message();
    return false;
  }
  is_regular = fs::is_regular_file(status);
  return true;
}

} // namespace

bool CollectRegularFiles(const fs::path& directory, std::vector<fs::path>& files,
                         std::string& error) {
  files.clear();

  std::error_code ec;
  if (!fs::exists(directory, ec) || ec) {
    error = "directory not found: " + directory.string();
    return false;
  }
  if (!fs::is_directory(directory, ec) || ec) {
    error = "path is not a directory: " + directory.string();
    return false;
  }

  fs::recursive_directory_iterator it(directory, ec);
  if (ec) {
    error = "failed to open directory '" + directory.string() + "': " + ec.message();
    return false;
  }

  const fs::recursive_directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    bool is_regular = false;
    if (!IsRegularFile(it->path(), is_regular, error)) {
      return false;
    }
    if (is_regular) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed while walking directory '" + directory.string() + "': " + ec.message();
    return false;
  }

  std::sort(files.begin(), files.end(), [](const fs::path& lhs, const fs::path& rhs) {
    return lhs.generic_string() < rhs.generic_string();
  });
  return true;
}

bool RunHashing(const HashingOptions& options, core::logging::Logger& logger,
                std::ostream& progress, HashingSummary& summary, std::string& error) {
  summary = HashingSummary{};

  if (options.manifest_path.empty()) {
    error = "manifest path cannot be empty";
    return false;
  }
  if (options.directory.empty()) {
    error = "directory cannot be empty";
    return false;
  }

  manifest::ManifestIndex index;
  if (!manifest::LoadManifest(options.manifest_path, index, summary.manifest, error)) {
    return false;
  }
  logger.Info("manifest loaded",
              {{"path", options.manifest_path.string()},
               {"present", summary.manifest.file_present},
               {"tracked_files", index.Size()},
               {"superseded_records", summary.manifest.superseded_records}});

  std::vector<fs::path> files;
  if (!CollectRegularFiles(options.directory, files, error)) {
    return false;
  }
  logger.Debug("directory scanned",
               {{"directory", options.directory.string()},
                {"regular_files", files.size()}});

  for (const auto& file_path : files) {
    ++summary.files_seen;
    const std::string key = file_path.generic_string();

    std::error_code ec;
    const std::uintmax_t size = fs::file_size(file_path, ec);
    if (ec) {
      error = "failed to read size of '" + key + "': " + ec.message();
      return false;
    }

    const manifest::ManifestRecord* known = index.Find(key);
    if (known != nullptr && known->size == static_cast<std::uint64_t>(size)) {
      ++summary.files_unchanged;
      logger.Debug("size unchanged, skipping", {{"file", key}});
      continue;
    }

    progress << "Processing " << key << "...\n";
    progress.flush();

    manifest::ManifestRecord record;
    record.file = key;
    record.size = static_cast<std::uint64_t>(size);
    std::uint64_t bytes_read = 0;
    if (!core::hash::ComputeFileMd5(file_path, record.md5, bytes_read, error)) {
      return false;
    }
    if (bytes_read != record.size) {
      logger.Warn("file size changed while hashing",
                  {{"file", key},
                   {"stat_size", record.size},
                   {"bytes_read", bytes_read}});
    }

    if (!manifest::AppendRecord(record, options.manifest_path, error)) {
      return false;
    }
    ++summary.files_hashed;
    summary.bytes_hashed += bytes_read;
    logger.Debug("record appended",
                 {{"file", key}, {"md5", record.md5}, {"size", record.size}});
  }

  return true;
}

} // namespace fim::pipelines
