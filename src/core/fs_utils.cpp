#include "core/fs_utils.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>

#if !defined(_WIN32)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace fim::core {

namespace {

// Flushes file data to stable storage before it is published by rename.
// Windows has no portable equivalent here; the rename alone is relied on.
bool SyncFileToDisk(const fs::path& file_path, std::string& error) {
#if defined(_WIN32)
  (void)file_path;
  (void)error;
  return true;
#else
  const int fd = ::open(file_path.c_str(), O_RDONLY);
  if (fd < 0) {
    error = "failed to reopen staging file '" + file_path.string() +
            "': " + std::error_code(errno, std::generic_category()).message();
    return false;
  }
  const int sync_result = ::fsync(fd);
  const int sync_errno = errno;
  ::close(fd);
  if (sync_result != 0) {
    error = "failed to sync staging file '" + file_path.string() +
            "': " + std::error_code(sync_errno, std::generic_category()).message();
    return false;
  }
  return true;
#endif
}

bool WriteStagingFile(const fs::path& staging, std::string_view contents, std::string& error) {
  {
    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "failed to create staging file '" + staging.string() + "'";
      return false;
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
      error = "failed while writing staging file '" + staging.string() + "'";
      return false;
    }
  }
  return SyncFileToDisk(staging, error);
}

void RemoveStagingFile(const fs::path& staging) {
  std::error_code ignored;
  fs::remove(staging, ignored);
}

// Follows symlinks so the file they point at is replaced, not the link.
// A target that does not exist yet is used as given.
bool ResolveReplaceTarget(const fs::path& target, fs::path& resolved, bool& exists,
                          std::string& error) {
  std::error_code ec;
  const fs::file_status link_status = fs::symlink_status(target, ec);
  if (ec && link_status.type() != fs::file_type::not_found) {
    error = "failed to stat '" + target.string() + "': " + ec.message();
    return false;
  }
  exists = fs::exists(link_status);
  if (!exists) {
    resolved = target;
    return true;
  }

  resolved = fs::canonical(target, ec);
  if (ec) {
    error = "failed to resolve '" + target.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace

bool EnsureParentDirectory(const fs::path& file_path, std::string& error) {
  if (file_path.empty()) {
    error = "file path cannot be empty";
    return false;
  }

  const fs::path parent = file_path.parent_path();
  if (parent.empty()) {
    return true;
  }

  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    error = "failed to create directory '" + parent.string() + "': " + ec.message();
    return false;
  }
  return true;
}

fs::path MakeStagingPath(const fs::path& target) {
  static std::atomic<std::uint64_t> sequence{0};
  const std::uint64_t n = sequence.fetch_add(1U, std::memory_order_relaxed);
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();

  fs::path staging = target;
  staging += ".tmp." + std::to_string(tick) + "." + std::to_string(n);
  return staging;
}

bool ReplaceFileAtomically(const fs::path& target, std::string_view contents,
                           std::string& error) {
  fs::path destination;
  bool existed = false;
  if (!ResolveReplaceTarget(target, destination, existed, error)) {
    return false;
  }
  if (!EnsureParentDirectory(destination, error)) {
    return false;
  }

  fs::perms original_perms = fs::perms::unknown;
  if (existed) {
    std::error_code ec;
    const fs::file_status status = fs::status(destination, ec);
    if (ec) {
      error = "failed to stat '" + destination.string() + "': " + ec.message();
      return false;
    }
    original_perms = status.permissions();
  }

  const fs::path staging = MakeStagingPath(destination);
  if (!WriteStagingFile(staging, contents, error)) {
    RemoveStagingFile(staging);
    return false;
  }

  if (original_perms != fs::perms::unknown) {
    std::error_code ec;
    fs::permissions(staging, original_perms, fs::perm_options::replace, ec);
    if (ec) {
      RemoveStagingFile(staging);
      error = "failed to copy permissions onto '" + staging.string() + "': " + ec.message();
      return false;
    }
  }

  std::error_code ec;
  fs::rename(staging, destination, ec);
  if (!ec) {
    return true;
  }

  // Some platforms refuse to rename over an existing file.
  std::error_code remove_ec;
  fs::remove(destination, remove_ec);
  ec.clear();
  fs::rename(staging, destination, ec);
  if (!ec) {
    return true;
  }

  RemoveStagingFile(staging);
  error = "failed to replace '" + destination.string() + "': " + ec.message();
  return false;
}

} // namespace fim::core
