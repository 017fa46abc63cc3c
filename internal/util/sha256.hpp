#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace zget::util {

struct HashCTXRelease {
  void operator()(EVP_MD_CTX* ctx) const;
};
using HashCTX = std::unique_ptr<EVP_MD_CTX, HashCTXRelease>;

/*
  Incremental SHA-256 over OpenSSL EVP.
*/
class Sha256 {
 public:
  Sha256();

  void        Update(const void* data, std::size_t size);
  std::string HexDigest();

 private:
  HashCTX ctx_;
};

/*
  Hashes a whole file, reading chunk_bytes at a time so memory use does not
  depend on file size. Throws IOError when the file cannot be read.
*/
std::string HashFile(const std::filesystem::path& path, std::size_t chunk_bytes = 1 << 20);

} // namespace zget::util
