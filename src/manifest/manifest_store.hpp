#pragma once

#include "manifest/record.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fim::manifest {

// Latest record per path, in the order each path was first seen. Upserting a
// known path replaces its hash and size in place.
class ManifestIndex {
public:
  // Returns true when `record.file` was already present and got replaced.
  bool Upsert(ManifestRecord record);

  const ManifestRecord* Find(std::string_view file) const;

  const std::vector<ManifestRecord>& Records() const {
    return records_;
  }

  std::size_t Size() const {
    return records_.size();
  }

  bool Empty() const {
    return records_.empty();
  }

private:
  std::vector<ManifestRecord> records_;
  std::unordered_map<std::string, std::size_t> positions_;
};

// Counters gathered while reading a manifest file.
struct LoadStats {
  bool file_present = false;
  std::size_t lines_read = 0;
  std::size_t blank_lines = 0;
  std::size_t records_parsed = 0;
  std::size_t superseded_records = 0;
  // 1-based line number of the record that failed to parse; 0 when the
  // failure (if any) was an I/O problem.
  std::size_t malformed_line = 0;
};

// Receives each parsed record in file order. Returning false stops the read;
// the visitor is expected to have filled `error`.
using RecordVisitor =
    std::function<bool(const ManifestRecord& record, std::size_t line_number, std::string& error)>;

// Streams every record of `manifest_path` to `visitor`.
//
// Contract:
// - A missing file is not an error: no records are visited and
//   `stats.file_present` stays false.
// - Blank or whitespace-only lines are skipped.
// - The first malformed line stops the read, sets `stats.malformed_line` and
//   returns false with `error` naming the file and line.
bool ReadManifestRecords(const std::filesystem::path& manifest_path, const RecordVisitor& visitor,
                         LoadStats& stats, std::string& error);

// Folds the manifest into `index`, later lines winning for the same path.
bool LoadManifest(const std::filesystem::path& manifest_path, ManifestIndex& index,
                  LoadStats& stats, std::string& error);

// Appends exactly one record line to `manifest_path`, creating the file and
// its parent directories when needed. The line is flushed before returning so
// records written before a later failure survive.
bool AppendRecord(const ManifestRecord& record, const std::filesystem::path& manifest_path,
                  std::string& error);

// Replaces the manifest with `records`, one line each, through a temp file and
// rename.
bool WriteManifest(const std::vector<ManifestRecord>& records,
                   const std::filesystem::path& manifest_path, std::string& error);

} // namespace fim::manifest
