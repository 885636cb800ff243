#ifndef FIM_TESTS_COMMON_MANIFEST_FIXTURES_HPP_
#define FIM_TESTS_COMMON_MANIFEST_FIXTURES_HPP_

#include "assertions.hpp"
#include "manifest/record.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fim::tests::common {

// Well-known digests used across fixtures.
inline constexpr std::string_view kMd5Empty = "d41d8cd98f00b204e9800998ecf8427e";
inline constexpr std::string_view kMd5Abc = "900150983cd24fb0d6963f7d28e17f72";
inline constexpr std::string_view kMd5HelloWorldNewline = "6f5902ac237024bdd0c176cb93063dc4";

inline void WriteFixtureFile(const std::filesystem::path& file_path, std::string_view content) {
  std::error_code ec;
  if (!file_path.parent_path().empty()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      Fail("failed to create fixture directory: " + file_path.parent_path().string());
    }
  }

  std::ofstream output(file_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    Fail("failed to open fixture file for writing: " + file_path.string());
  }

  output << content;
  if (!output) {
    Fail("failed while writing fixture file: " + file_path.string());
  }
}

inline fim::manifest::ManifestRecord MakeRecord(std::string file, std::string_view md5,
                                                std::uint64_t size) {
  fim::manifest::ManifestRecord record;
  record.file = std::move(file);
  record.md5 = std::string(md5);
  record.size = size;
  return record;
}

// Writes records exactly as the tool would, one JSON line each.
inline void WriteManifestFixture(const std::filesystem::path& manifest_path,
                                 const std::vector<fim::manifest::ManifestRecord>& records) {
  std::string text;
  for (const auto& record : records) {
    text += fim::manifest::ToJson(record);
    text += '\n';
  }
  WriteFixtureFile(manifest_path, text);
}

// Parses every non-empty manifest line, aborting on a malformed one.
inline std::vector<fim::manifest::ManifestRecord> ReadManifestRecordsOrFail(
    const std::filesystem::path& manifest_path) {
  std::vector<fim::manifest::ManifestRecord> records;
  for (const auto& line : ReadNonEmptyLines(manifest_path)) {
    fim::manifest::ManifestRecord record;
    std::string error;
    if (!fim::manifest::ParseRecordLine(line, record, error)) {
      Fail("unparseable manifest line '" + line + "': " + error);
    }
    records.push_back(std::move(record));
  }
  return records;
}

inline std::size_t CountRecordsFor(const std::vector<fim::manifest::ManifestRecord>& records,
                                   std::string_view file) {
  std::size_t count = 0;
  for (const auto& record : records) {
    if (record.file == file) {
      ++count;
    }
  }
  return count;
}

} // namespace fim::tests::common

#endif // FIM_TESTS_COMMON_MANIFEST_FIXTURES_HPP_
