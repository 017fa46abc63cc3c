#include "internal/util/sha256.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "support/fake_extractor.hpp"

namespace {

constexpr const char* kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* kAbcDigest   = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

void TestKnownVectors() {
  zget::util::Sha256 empty;
  assert(empty.HexDigest() == kEmptyDigest);

  zget::util::Sha256 abc;
  abc.Update("abc", 3);
  assert(abc.HexDigest() == kAbcDigest);
}

void TestIncrementalUpdatesMatchOneShot() {
  zget::util::Sha256 split;
  split.Update("a", 1);
  split.Update("", 0);
  split.Update("bc", 2);
  assert(split.HexDigest() == kAbcDigest);
}

void TestHashFileIsIndependentOfChunkSize() {
  zget::testing::TestDir dir("sha256");
  const auto             path = dir.Path() / "blob.bin";
  {
    std::ofstream out(path, std::ios::binary);
    for (int i = 0; i < 100000; ++i) out.put(static_cast<char>(i * 31));
  }

  const auto whole = zget::util::HashFile(path);
  assert(whole.size() == 64);
  assert(zget::util::HashFile(path, 7) == whole);
  assert(zget::util::HashFile(path, 4096) == whole);

  const auto empty_path = dir.Path() / "empty.bin";
  std::ofstream(empty_path, std::ios::binary).close();
  assert(zget::util::HashFile(empty_path) == kEmptyDigest);
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)zget::util::HashFile("/nonexistent/zget/file.mp4");
  } catch (const zget::util::IOError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestKnownVectors();
  TestIncrementalUpdatesMatchOneShot();
  TestHashFileIsIndependentOfChunkSize();
  TestMissingFileThrows();

  std::cout << "sha256_test: pass\n";
  return 0;
}
