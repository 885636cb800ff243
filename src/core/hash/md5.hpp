#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fim::core::hash {

// Length of an MD5 digest rendered as lowercase hex.
constexpr std::size_t kMd5HexLength = 32;

// Digest of an in-memory buffer. Returns false only if the crypto backend
// refuses the operation.
bool Md5Hex(std::string_view data, std::string& hash_hex, std::string& error);

// Streams the file in fixed-size chunks so large files are never held in
// memory. `bytes_read` reports how many bytes went into the digest.
bool ComputeFileMd5(const std::filesystem::path& file_path, std::string& hash_hex,
                    std::uint64_t& bytes_read, std::string& error);

// True when `text` is exactly 32 hex digits.
bool IsMd5Hex(std::string_view text);

} // namespace fim::core::hash
