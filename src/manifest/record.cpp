#include "manifest/record.hpp"

#include "core/hash/md5.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <string>
#include <utility>

namespace fim::manifest {

std::string ToJson(const ManifestRecord& record) {
  std::string out;
  out.reserve(record.file.size() + record.md5.size() + 40U);
  out += "{\"file\":";
  core::AppendJsonString(out, record.file);
  out += ",\"md5\":";
  core::AppendJsonString(out, record.md5);
  out += ",\"size\":";
  out += std::to_string(record.size);
  out += '}';
  return out;
}

bool ParseRecordLine(std::string_view line, ManifestRecord& record, std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(line, root, error)) {
    return false;
  }
  if (root.type != core::json::Value::Type::kObject) {
    error = "record must be a JSON object";
    return false;
  }

  ManifestRecord parsed;
  if (!core::json::GetStringField(root, "file", parsed.file, error)) {
    return false;
  }
  if (parsed.file.empty()) {
    error = "field 'file' cannot be empty";
    return false;
  }

  if (!core::json::GetStringField(root, "md5", parsed.md5, error)) {
    return false;
  }
  if (!core::hash::IsMd5Hex(parsed.md5)) {
    error = "field 'md5' must be " + std::to_string(core::hash::kMd5HexLength) +
            " hex digits: " + parsed.md5;
    return false;
  }

  if (!core::json::GetUnsignedField(root, "size", parsed.size, error)) {
    return false;
  }

  record = std::move(parsed);
  return true;
}

} // namespace fim::manifest
