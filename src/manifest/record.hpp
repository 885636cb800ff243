#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fim::manifest {

// One observed state of one file. `file` is the key: the path string exactly
// as the scanner produced it, never normalised afterwards.
struct ManifestRecord {
  std::string file;
  std::string md5;
  std::uint64_t size = 0;
};

inline bool operator==(const ManifestRecord& lhs, const ManifestRecord& rhs) {
  return lhs.file == rhs.file && lhs.md5 == rhs.md5 && lhs.size == rhs.size;
}

inline bool operator!=(const ManifestRecord& lhs, const ManifestRecord& rhs) {
  return !(lhs == rhs);
}

// Serializes one record as a single-line JSON object without the trailing
// newline: {"file":"...","md5":"...","size":N}
std::string ToJson(const ManifestRecord& record);

// Parses one manifest line. Fails on anything that is not an object carrying
// a non-empty `file` string, a 32-digit hex `md5` and an unsigned integer
// `size`. Extra fields are ignored.
bool ParseRecordLine(std::string_view line, ManifestRecord& record, std::string& error);

} // namespace fim::manifest
