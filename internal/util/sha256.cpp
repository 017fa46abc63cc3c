#include "sha256.hpp"

#include <fstream>
#include <vector>

#include "internal/util/errors.hpp"

namespace zget::util {

void HashCTXRelease::operator()(EVP_MD_CTX* ctx) const {
  ::EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || ::EVP_DigestInit_ex(ctx_.get(), ::EVP_sha256(), nullptr) != 1) {
    throw IOError("sha256: EVP_DigestInit_ex failed");
  }
}

void Sha256::Update(const void* data, std::size_t size) {
  if (::EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw IOError("sha256: EVP_DigestUpdate failed");
  }
}

std::string Sha256::HexDigest() {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  size = 0;
  if (::EVP_DigestFinal_ex(ctx_.get(), digest, &size) != 1) {
    throw IOError("sha256: EVP_DigestFinal_ex failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(size * 2);
  for (unsigned int i = 0; i < size; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

std::string HashFile(const std::filesystem::path& path, std::size_t chunk_bytes) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IOError("cannot open for hashing: " + path.string());
  }

  Sha256            hasher;
  std::vector<char> buffer(chunk_bytes > 0 ? chunk_bytes : 8192);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0) {
      hasher.Update(buffer.data(), static_cast<std::size_t>(got));
    }
  }
  if (in.bad()) {
    throw IOError("read failed while hashing: " + path.string());
  }
  return hasher.HexDigest();
}

} // namespace zget::util
