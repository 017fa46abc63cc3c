#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "internal/ingest/extractor.hpp"
#include "internal/model/media_record.hpp"

namespace zget::ingest {

/*
  Stores a local copy of the item's thumbnail. Returns the local path, or
  nullopt when there is nothing to cache. May throw; callers treat failures
  as non-fatal.
*/
class ThumbnailCache {
 public:
  virtual ~ThumbnailCache() = default;

  virtual std::optional<std::filesystem::path> Cache(const model::MediaRecord& record, const ExtractorResult& result) = 0;
};

/*
  Copies the thumbnail the extractor left in the work dir to
  <thumbnails_dir>/<platform>_<source_id>.<ext>.
*/
class LocalThumbnailCache final : public ThumbnailCache {
 public:
  explicit LocalThumbnailCache(std::filesystem::path thumbnails_dir);

  std::optional<std::filesystem::path> Cache(const model::MediaRecord& record, const ExtractorResult& result) override;

 private:
  std::filesystem::path thumbnails_dir_;
};

/*
  Writes an auxiliary file next to the library (metadata export, NFO, ...).
  Runs before commit, so record.id is not yet assigned. May throw; callers
  treat failures as non-fatal.
*/
class SidecarWriter {
 public:
  virtual ~SidecarWriter() = default;

  virtual std::filesystem::path Write(const model::MediaRecord& record) = 0;
};

/*
  Curated JSON export: <exports_dir>/<platform>_<source_id>_<YYYYmmdd_HHMMSS>.json
*/
class JsonExportWriter final : public SidecarWriter {
 public:
  explicit JsonExportWriter(std::filesystem::path exports_dir);

  std::filesystem::path Write(const model::MediaRecord& record) override;

  // The JSON document Write() stores.
  static std::string ToJson(const model::MediaRecord& record);

 private:
  std::filesystem::path exports_dir_;
};

} // namespace zget::ingest
