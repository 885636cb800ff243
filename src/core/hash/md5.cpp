#include "core/hash/md5.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <fstream>
#include <memory>

namespace fs = std::filesystem;

namespace fim::core::hash {

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string HexEncode(const unsigned char* data, unsigned int size) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(size) * 2U);
  for (unsigned int i = 0; i < size; ++i) {
    out.push_back(kHexDigits[data[i] >> 4U]);
    out.push_back(kHexDigits[data[i] & 0x0FU]);
  }
  return out;
}

bool BeginDigest(EvpMdCtxPtr& ctx, std::string& error) {
  ctx.reset(EVP_MD_CTX_new());
  if (!ctx) {
    error = "failed to allocate MD5 digest context";
    return false;
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    error = "failed to initialise MD5 digest";
    return false;
  }
  return true;
}

bool FinishDigest(EvpMdCtxPtr& ctx, std::string& hash_hex, std::string& error) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_size = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_size) != 1) {
    error = "failed to finalise MD5 digest";
    return false;
  }
  hash_hex = HexEncode(digest.data(), digest_size);
  return true;
}

} // namespace

bool Md5Hex(std::string_view data, std::string& hash_hex, std::string& error) {
  EvpMdCtxPtr ctx;
  if (!BeginDigest(ctx, error)) {
    return false;
  }
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    error = "failed to update MD5 digest";
    return false;
  }
  return FinishDigest(ctx, hash_hex, error);
}

bool ComputeFileMd5(const fs::path& file_path, std::string& hash_hex, std::uint64_t& bytes_read,
                    std::string& error) {
  bytes_read = 0;

  std::ifstream in_file(file_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open file for hashing: " + file_path.string();
    return false;
  }

  EvpMdCtxPtr ctx;
  if (!BeginDigest(ctx, error)) {
    return false;
  }

  std::array<char, kReadChunkBytes> buffer{};
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(read_count)) != 1) {
      error = "failed to update MD5 digest for: " + file_path.string();
      return false;
    }
    bytes_read += static_cast<std::uint64_t>(read_count);
  }

  if (!in_file.eof()) {
    error = "failed while reading file for hashing: " + file_path.string();
    return false;
  }

  return FinishDigest(ctx, hash_hex, error);
}

bool IsMd5Hex(std::string_view text) {
  if (text.size() != kMd5HexLength) {
    return false;
  }
  for (const char c : text) {
    if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace fim::core::hash
