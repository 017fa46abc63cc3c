#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/ingest/extractor.hpp"

namespace zget::ingest {

/*
  One way of finding the file an extraction produced.
*/
class LocateStrategy {
 public:
  virtual ~LocateStrategy() = default;

  virtual std::string_view Name() const = 0;

  virtual std::optional<std::filesystem::path> Locate(const std::filesystem::path& work_dir, const ExtractorResult& result) const = 0;
};

// result.filepath, when it exists.
class ExplicitPathStrategy final : public LocateStrategy {
 public:
  std::string_view Name() const override {
    return "explicit_path";
  }
  std::optional<std::filesystem::path> Locate(const std::filesystem::path& work_dir, const ExtractorResult& result) const override;
};

// First entry of result.produced_files that exists.
class ProducedFilesStrategy final : public LocateStrategy {
 public:
  std::string_view Name() const override {
    return "produced_files";
  }
  std::optional<std::filesystem::path> Locate(const std::filesystem::path& work_dir, const ExtractorResult& result) const override;
};

// mp4/webm/mkv whose name contains (upload date and uploader) or the first 20 characters of the title.
class NameMatchStrategy final : public LocateStrategy {
 public:
  std::string_view Name() const override {
    return "name_match";
  }
  std::optional<std::filesystem::path> Locate(const std::filesystem::path& work_dir, const ExtractorResult& result) const override;
};

// Most recently modified .mp4 in work_dir.
class NewestMp4Strategy final : public LocateStrategy {
 public:
  std::string_view Name() const override {
    return "newest_mp4";
  }
  std::optional<std::filesystem::path> Locate(const std::filesystem::path& work_dir, const ExtractorResult& result) const override;
};

/*
  Tries each strategy in order and returns the first hit.
*/
class OutputLocator {
 public:
  // The default strategy order.
  OutputLocator();
  explicit OutputLocator(std::vector<std::unique_ptr<LocateStrategy>> strategies);

  // Throws IOError when no strategy finds a file.
  std::filesystem::path Locate(const std::filesystem::path& work_dir, const ExtractorResult& result) const;

 private:
  std::vector<std::unique_ptr<LocateStrategy>> strategies_;
};

} // namespace zget::ingest
