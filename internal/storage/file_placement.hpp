#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace zget::storage {

/*
  Moves src into dest_dir under filename and returns the final path.

  The final name only ever appears fully written:
    same volume  : hard link src -> final (fails instead of replacing), unlink src
    cross volume : copy -> dest_dir/.<name>.XXXXXX.part (unique per call), fsync,
                   link -> final, unlink both
  Filesystems without hard links fall back to renameat2(RENAME_NOREPLACE).
  An existing file is never replaced; the name gets a numeric suffix instead.

  Throws IOError on failure. src is left in place on failure.
*/
std::filesystem::path MoveIntoPlace(const std::filesystem::path& src, const std::filesystem::path& dest_dir,
                                    const std::string& filename);

/*
  Create base (or base with the first free numeric suffix) with O_EXCL, fill
  it and return its path. Never opens an existing file; a failed write
  removes what it created. Throws IOError.
*/
std::filesystem::path WriteNewFile(const std::filesystem::path& base, std::string_view contents);
std::filesystem::path CopyToNewFile(const std::filesystem::path& src, const std::filesystem::path& base);

// Best-effort unlink; returns false when nothing was removed.
bool RemoveFile(const std::filesystem::path& path);

/*
  Owns a freshly created private directory (mkdtemp) and removes it with its
  contents when destroyed, on every exit path.
*/
class ScopedTempDir {
 public:
  explicit ScopedTempDir(const std::filesystem::path& parent, const std::string& prefix = "zget_");
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&)            = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace zget::storage
