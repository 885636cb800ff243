#ifndef FIM_CORE_FS_UTILS_HPP_
#define FIM_CORE_FS_UTILS_HPP_

#include <filesystem>
#include <string>
#include <string_view>

namespace fim::core {

// Creates the parent directory chain of `file_path` when it has one.
bool EnsureParentDirectory(const std::filesystem::path& file_path, std::string& error);

// Sibling path used as the staging file for an atomic replace of `target`.
// Unique per process and call.
std::filesystem::path MakeStagingPath(const std::filesystem::path& target);

// Writes `contents` to a staging file next to `target`, syncs it, then renames
// it over `target`. Readers observe the old file or the complete new one,
// never a partial write. A symlinked `target` is followed, so the file it
// points at is replaced and the link survives; an existing file keeps its
// permission bits. On failure the staging file is removed and `target` is
// left untouched.
bool ReplaceFileAtomically(const std::filesystem::path& target, std::string_view contents,
                           std::string& error);

} // namespace fim::core

#endif // FIM_CORE_FS_UTILS_HPP_
