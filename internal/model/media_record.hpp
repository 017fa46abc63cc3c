#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace zget::model {

/*
  Persistent library row.

  IMPORTANT:
  - source_url and (platform, source_id) are unique; content_hash is unique
    whenever it is set. The store enforces all three.
  - local_path only ever names a file that was moved into place atomically.
  - raw_json is opaque source metadata and never used for identity.
*/
struct MediaRecord {
  int64_t id = 0; // assigned by the store on insert

  std::string source_url;
  std::string platform;
  std::string source_id;

  std::string                     title;
  std::string                     description;
  std::string                     uploader;
  std::string                     uploader_id;
  std::optional<util::TimePoint>  upload_date;
  std::optional<int64_t>          duration_seconds;
  std::optional<int64_t>          view_count;
  std::optional<int64_t>          like_count;
  std::optional<int64_t>          comment_count;

  std::string           resolution; // "WxH", '?' for an unknown side
  std::optional<double> fps;
  std::string           codec;
  uint64_t              file_size_bytes = 0;
  std::string           content_hash; // lower-case hex SHA-256

  std::string     local_path;
  std::string     thumbnail_path;
  util::TimePoint ingested_at{};

  std::vector<std::string> tags;
  std::optional<int>       rating; // 1..5
  std::string              notes;
  std::string              collection;

  std::string raw_json;
};

struct PlatformCount {
  std::string platform;
  uint64_t    count = 0;
};

struct LibraryStats {
  uint64_t                   count       = 0;
  uint64_t                   total_bytes = 0;
  std::vector<PlatformCount> platforms; // ordered by count, descending
};

struct UploaderCount {
  std::string uploader;
  std::string platform;
  uint64_t    count = 0;
};

// Records ingested since the start of the current UTC day and in the last 7 days.
struct DownloadRate {
  uint64_t today_count = 0;
  uint64_t today_bytes = 0;
  uint64_t week_count  = 0;
  uint64_t week_bytes  = 0;
};

} // namespace zget::model
