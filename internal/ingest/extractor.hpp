#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/ingest/cancellation.hpp"
#include "internal/model/queue_item.hpp"

namespace zget::ingest {

struct ExtractRequest {
  std::string           url;
  std::filesystem::path work_dir; // the extractor writes only here
  std::string           format_id;
  std::string           max_quality;
};

/*
  Typed view of what the extractor learned about the item.
  Missing values stay empty / nullopt.
*/
struct ExtractorResult {
  std::string source_id;
  std::string title;
  std::string description;
  std::string uploader;
  std::string uploader_id;
  std::string upload_date; // YYYYMMDD

  std::optional<double>   duration; // seconds, may be fractional
  std::optional<int64_t>  width;
  std::optional<int64_t>  height;
  std::optional<double>   fps;
  std::string             vcodec;
  std::optional<int64_t>  view_count;
  std::optional<int64_t>  like_count;
  std::optional<int64_t>  comment_count;
  std::string             thumbnail_url;
  std::string             thumbnail_file; // local copy written by the extractor, if any

  // where the extractor says it wrote the file; may be stale or empty
  std::string              filepath;
  std::vector<std::string> produced_files;

  std::string raw_json;
};

/*
  Receives progress from a running extraction. Called on the run's thread.
*/
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;

  virtual void OnProgress(const model::Progress& progress) = 0;
};

/*
  Extractor

  Fetches the media at request.url into request.work_dir. Implementations
  report progress through sink, stop early once token is cancelled (throwing
  CancelledError), and throw ExtractionError on any other failure.
*/
class Extractor {
 public:
  virtual ~Extractor() = default;

  virtual ExtractorResult Extract(const ExtractRequest& request, ProgressSink& sink, const CancellationToken& token) = 0;
};

} // namespace zget::ingest
