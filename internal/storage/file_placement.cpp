#include "file_placement.hpp"

#include <fcntl.h>
#include <stdio.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace zget::storage {

namespace {

constexpr int kMaxNameAttempts = 1000;

std::string ErrnoMessage(const std::string& what, const std::filesystem::path& path, int err) {
  return what + " " + path.string() + ": " + std::strerror(err);
}

class Fd {
 public:
  explicit Fd(int fd) : fd_(fd) {
  }
  Fd(Fd&& other) noexcept : fd_(other.Release()) {
  }
  ~Fd() {
    if (fd_ >= 0) ::close(fd_);
  }
  Fd(const Fd&)            = delete;
  Fd& operator=(const Fd&) = delete;

  int Get() const {
    return fd_;
  }

  int Release() {
    int fd = fd_;
    fd_    = -1;
    return fd;
  }

 private:
  int fd_;
};

void WriteAll(int fd, const char* data, size_t size, const std::filesystem::path& path) {
  size_t written = 0;
  while (written < size) {
    const ssize_t n = ::write(fd, data + written, size - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw util::IOError(ErrnoMessage("write", path, errno));
    }
    written += static_cast<size_t>(n);
  }
}

void CopyData(const std::filesystem::path& src, int out_fd, const std::filesystem::path& out_path) {
  Fd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
  if (in.Get() < 0) {
    throw util::IOError(ErrnoMessage("open", src, errno));
  }

  std::vector<char> buffer(1 << 20);
  while (true) {
    const ssize_t got = ::read(in.Get(), buffer.data(), buffer.size());
    if (got == 0) break;
    if (got < 0) {
      if (errno == EINTR) continue;
      throw util::IOError(ErrnoMessage("read", src, errno));
    }
    WriteAll(out_fd, buffer.data(), static_cast<size_t>(got), out_path);
  }
}

void SyncAndClose(Fd& out, const std::filesystem::path& path) {
  if (::fsync(out.Get()) != 0) {
    throw util::IOError(ErrnoMessage("fsync", path, errno));
  }
  if (::close(out.Release()) != 0) {
    throw util::IOError(ErrnoMessage("close", path, errno));
  }
}

struct NewFile {
  std::filesystem::path path;
  Fd                    fd;
};

/*
  Creates base, or base with the first free numeric suffix, with O_EXCL.
  An existing file is never opened.
*/
NewFile CreateNewFile(const std::filesystem::path& base) {
  for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
    auto candidate = attempt == 0 ? base : WithSuffix(base, attempt);
    int  fd        = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd >= 0) {
      return NewFile{std::move(candidate), Fd(fd)};
    }
    if (errno != EEXIST) {
      throw util::IOError(ErrnoMessage("create", candidate, errno));
    }
  }
  throw util::IOError("no free name for " + base.string());
}

/*
  Copy src to a private staging file in dest_dir and fsync it. The name is
  hidden and unique per call (mkostemps), so concurrent placements of the
  same filename never share a staging file.
*/
std::filesystem::path CopyToPart(const std::filesystem::path& src, const std::filesystem::path& dest_dir, const std::string& filename) {
  static constexpr char kPartSuffix[] = ".part";

  std::string pattern = (dest_dir / ("." + filename + ".XXXXXX" + kPartSuffix)).string();
  Fd          out(::mkostemps(pattern.data(), sizeof(kPartSuffix) - 1, O_CLOEXEC));
  if (out.Get() < 0) {
    throw util::IOError(ErrnoMessage("create", pattern, errno));
  }

  const std::filesystem::path part(pattern);
  try {
    if (::fchmod(out.Get(), 0644) != 0) {
      throw util::IOError(ErrnoMessage("chmod", part, errno));
    }
    CopyData(src, out.Get(), part);
    SyncAndClose(out, part);
  } catch (...) {
    RemoveFile(part);
    throw;
  }
  return part;
}

/*
  Publish staged under a name in dest_dir that did not exist before.
  Returns the final path. staged is consumed on success.
*/
std::filesystem::path Publish(const std::filesystem::path& staged, const std::filesystem::path& dest_dir, const std::string& filename) {
  const auto base = dest_dir / filename;

  for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
    const auto candidate = attempt == 0 ? base : WithSuffix(base, attempt);

    if (::link(staged.c_str(), candidate.c_str()) == 0) {
      ::unlink(staged.c_str());
      return candidate;
    }

    const int err = errno;
    if (err == EEXIST) {
      continue;
    }
    if (err == EPERM || err == ENOTSUP || err == EOPNOTSUPP || err == EMLINK) {
      // No hard links on this filesystem.
      if (::renameat2(AT_FDCWD, staged.c_str(), AT_FDCWD, candidate.c_str(), RENAME_NOREPLACE) == 0) {
        return candidate;
      }
      if (errno == EEXIST) {
        continue;
      }
      throw util::IOError(ErrnoMessage("rename", candidate, errno));
    }
    throw util::IOError(ErrnoMessage("link", candidate, err));
  }

  throw util::IOError("no free destination name for " + base.string());
}

} // namespace

std::filesystem::path MoveIntoPlace(const std::filesystem::path& src, const std::filesystem::path& dest_dir, const std::string& filename) {
  std::error_code ec;
  std::filesystem::create_directories(dest_dir, ec);
  if (ec) {
    throw util::IOError("create destination " + dest_dir.string() + ": " + ec.message());
  }

  struct stat src_stat {};
  struct stat dir_stat {};
  if (::stat(src.c_str(), &src_stat) != 0) {
    throw util::IOError(ErrnoMessage("stat", src, errno));
  }
  if (::stat(dest_dir.c_str(), &dir_stat) != 0) {
    throw util::IOError(ErrnoMessage("stat", dest_dir, errno));
  }

  if (src_stat.st_dev == dir_stat.st_dev) {
    return Publish(src, dest_dir, filename);
  }

  // Cross-volume: stage a full copy next to the destination first.
  const auto part = CopyToPart(src, dest_dir, filename);
  try {
    auto final_path = Publish(part, dest_dir, filename);
    RemoveFile(src);
    return final_path;
  } catch (...) {
    RemoveFile(part);
    throw;
  }
}

std::filesystem::path WriteNewFile(const std::filesystem::path& base, std::string_view contents) {
  auto file = CreateNewFile(base);
  try {
    WriteAll(file.fd.Get(), contents.data(), contents.size(), file.path);
    SyncAndClose(file.fd, file.path);
  } catch (...) {
    RemoveFile(file.path);
    throw;
  }
  return file.path;
}

std::filesystem::path CopyToNewFile(const std::filesystem::path& src, const std::filesystem::path& base) {
  auto file = CreateNewFile(base);
  try {
    CopyData(src, file.fd.Get(), file.path);
    SyncAndClose(file.fd, file.path);
  } catch (...) {
    RemoveFile(file.path);
    throw;
  }
  return file.path;
}

bool RemoveFile(const std::filesystem::path& path) {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(path, ec);
  if (ec) {
    ZGET_LOG_WARN("Failed to remove file", {observability::StringField("path", path.string()), observability::StringField("error", ec.message())});
    return false;
  }
  return removed;
}

ScopedTempDir::ScopedTempDir(const std::filesystem::path& parent, const std::string& prefix) {
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw util::IOError("create temp root " + parent.string() + ": " + ec.message());
  }

  std::string pattern = (parent / (prefix + "XXXXXX")).string();
  if (::mkdtemp(pattern.data()) == nullptr) {
    throw util::IOError(ErrnoMessage("mkdtemp", pattern, errno));
  }
  path_ = pattern;
}

ScopedTempDir::~ScopedTempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    ZGET_LOG_WARN("Failed to remove temp directory", {observability::StringField("path", path_.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace zget::storage
