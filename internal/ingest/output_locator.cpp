#include "output_locator.hpp"

#include <algorithm>
#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace zget::ingest {

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> ExistingFile(const fs::path& work_dir, const std::string& candidate) {
  if (candidate.empty()) {
    return std::nullopt;
  }
  fs::path path(candidate);
  if (path.is_relative()) {
    path = work_dir / path;
  }
  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    return path;
  }
  return std::nullopt;
}

// Regular files in work_dir with the given extension, sorted by name.
std::vector<fs::path> FilesWithExtension(const fs::path& work_dir, std::string_view extension) {
  std::vector<fs::path> files;
  std::error_code       ec;
  for (fs::directory_iterator it(work_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == extension) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::string Utf8Prefix(const std::string& s, std::size_t max_chars) {
  std::size_t i = 0, chars = 0;
  while (i < s.size() && chars < max_chars) {
    const auto c = static_cast<unsigned char>(s[i]);
    i += c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xe ? 3 : 4;
    ++chars;
  }
  return s.substr(0, std::min(i, s.size()));
}

} // namespace

std::optional<fs::path> ExplicitPathStrategy::Locate(const fs::path& work_dir, const ExtractorResult& result) const {
  return ExistingFile(work_dir, result.filepath);
}

std::optional<fs::path> ProducedFilesStrategy::Locate(const fs::path& work_dir, const ExtractorResult& result) const {
  for (const auto& produced : result.produced_files) {
    if (auto path = ExistingFile(work_dir, produced)) {
      return path;
    }
  }
  return std::nullopt;
}

std::optional<fs::path> NameMatchStrategy::Locate(const fs::path& work_dir, const ExtractorResult& result) const {
  const std::string title_prefix = Utf8Prefix(result.title, 20);
  for (const char* extension : {".mp4", ".webm", ".mkv"}) {
    for (const auto& file : FilesWithExtension(work_dir, extension)) {
      const auto name = file.filename().string();
      const bool by_date_and_uploader = !result.upload_date.empty() && !result.uploader.empty() &&
                                        name.find(result.upload_date) != std::string::npos &&
                                        name.find(result.uploader) != std::string::npos;
      const bool by_title = !title_prefix.empty() && name.find(title_prefix) != std::string::npos;
      if (by_date_and_uploader || by_title) {
        return file;
      }
    }
  }
  return std::nullopt;
}

std::optional<fs::path> NewestMp4Strategy::Locate(const fs::path& work_dir, const ExtractorResult&) const {
  std::optional<fs::path> newest;
  fs::file_time_type      newest_time{};
  for (const auto& file : FilesWithExtension(work_dir, ".mp4")) {
    std::error_code ec;
    const auto      mtime = fs::last_write_time(file, ec);
    if (ec) continue;
    if (!newest || mtime > newest_time) {
      newest      = file;
      newest_time = mtime;
    }
  }
  return newest;
}

OutputLocator::OutputLocator() {
  strategies_.push_back(std::make_unique<ExplicitPathStrategy>());
  strategies_.push_back(std::make_unique<ProducedFilesStrategy>());
  strategies_.push_back(std::make_unique<NameMatchStrategy>());
  strategies_.push_back(std::make_unique<NewestMp4Strategy>());
}

OutputLocator::OutputLocator(std::vector<std::unique_ptr<LocateStrategy>> strategies) : strategies_(std::move(strategies)) {
}

fs::path OutputLocator::Locate(const fs::path& work_dir, const ExtractorResult& result) const {
  for (const auto& strategy : strategies_) {
    if (auto path = strategy->Locate(work_dir, result)) {
      ZGET_LOG_DEBUG("located extractor output",
                     {observability::StringField("strategy", strategy->Name()), observability::StringField("path", path->string())});
      return *path;
    }
  }
  throw util::IOError("Downloaded file not found in " + work_dir.string());
}

} // namespace zget::ingest
