#include "manifest/manifest_store.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace fim::manifest {

namespace {

bool IsBlank(std::string_view line) {
  return std::all_of(line.begin(), line.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
}

} // namespace

bool ManifestIndex::Upsert(ManifestRecord record) {
  const auto it = positions_.find(record.file);
  if (it != positions_.end()) {
    records_[it->second] = std::move(record);
    return true;
  }

  positions_.emplace(record.file, records_.size());
  records_.push_back(std::move(record));
  return false;
}

const ManifestRecord* ManifestIndex::Find(std::string_view file) const {
  const auto it = positions_.find(std::string(file));
  if (it == positions_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

bool ReadManifestRecords(const fs::path& manifest_path, const RecordVisitor& visitor,
                         LoadStats& stats, std::string& error) {
  stats = LoadStats{};
  error.clear();

  std::error_code ec;
  const bool exists = fs::exists(manifest_path, ec);
  if (ec) {
    error = "failed to access manifest '" + manifest_path.string() + "': " + ec.message();
    return false;
  }
  if (!exists) {
    return true;
  }
  stats.file_present = true;

  std::ifstream in_file(manifest_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open manifest '" + manifest_path.string() + "' for reading";
    return false;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in_file, line)) {
    ++line_number;
    ++stats.lines_read;
    if (IsBlank(line)) {
      ++stats.blank_lines;
      continue;
    }

    ManifestRecord record;
    std::string parse_error;
    if (!ParseRecordLine(line, record, parse_error)) {
      stats.malformed_line = line_number;
      error = "malformed record in '" + manifest_path.string() + "' at line " +
              std::to_string(line_number) + ": " + parse_error;
      return false;
    }
    ++stats.records_parsed;

    if (!visitor(record, line_number, error)) {
      return false;
    }
  }

  if (!in_file.eof() && in_file.fail()) {
    error = "failed while reading manifest '" + manifest_path.string() + "'";
    return false;
  }

  return true;
}

bool LoadManifest(const fs::path& manifest_path, ManifestIndex& index, LoadStats& stats,
                  std::string& error) {
  index = ManifestIndex{};
  std::size_t superseded = 0;
  const bool ok = ReadManifestRecords(
      manifest_path,
      [&index, &superseded](const ManifestRecord& record, std::size_t, std::string&) {
        if (index.Upsert(record)) {
          ++superseded;
        }
        return true;
      },
      stats, error);
  stats.superseded_records = superseded;
  return ok;
}

bool AppendRecord(const ManifestRecord& record, const fs::path& manifest_path,
                  std::string& error) {
  if (!core::EnsureParentDirectory(manifest_path, error)) {
    return false;
  }

  std::ofstream out_file(manifest_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open manifest '" + manifest_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(record) << '\n';
  out_file.flush();
  if (!out_file) {
    error = "failed while appending to manifest '" + manifest_path.string() + "'";
    return false;
  }

  return true;
}

bool WriteManifest(const std::vector<ManifestRecord>& records, const fs::path& manifest_path,
                   std::string& error) {
  std::string text;
  for (const auto& record : records) {
    text += ToJson(record);
    text += '\n';
  }

  return core::ReplaceFileAtomically(manifest_path, text, error);
}

} // namespace fim::manifest
