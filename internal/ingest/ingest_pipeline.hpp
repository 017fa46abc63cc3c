#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/ingest/cancellation.hpp"
#include "internal/ingest/destination_resolver.hpp"
#include "internal/ingest/extractor.hpp"
#include "internal/ingest/output_locator.hpp"
#include "internal/ingest/side_persistence.hpp"
#include "internal/library/library_store.hpp"
#include "internal/model/media_record.hpp"
#include "internal/model/queue_item.hpp"

namespace zget::ingest {

struct PipelineOptions {
  std::filesystem::path temp_dir; // parent of the per-run private directories
  bool                  check_url          = true;
  bool                  check_hash         = true;
  bool                  store_raw_metadata = true;
  std::size_t           hash_chunk_bytes   = 1 << 20;
  std::string           max_quality        = "best";
};

/*
  Ingest Pipeline

  One call takes a URL from download to a committed library record:

    pre-check url -> resolve destination -> extract into private temp dir
    -> locate output -> atomic placement -> hash -> post-check hash
    -> side persistence (best effort) -> commit -> temp dir removed

  Throws DuplicateError, ExtractionError, IOError, StoreError or
  CancelledError. On any throw nothing is left in the destination and no
  record exists for this run.

  Runs for the same URL are serialized; runs for different URLs are
  independent and may execute concurrently.
*/
class IngestPipeline {
 public:
  IngestPipeline(std::shared_ptr<library::LibraryStore> store, std::shared_ptr<Extractor> extractor, DestinationResolver resolver,
                 PipelineOptions options, std::shared_ptr<ThumbnailCache> thumbnails = nullptr,
                 std::vector<std::shared_ptr<SidecarWriter>> sidecars = {});

  model::MediaRecord Ingest(const std::string& url, const model::IngestOptions& options, ProgressSink& sink,
                            const CancellationToken& token);

 private:
  model::MediaRecord Run(const std::string& url, const std::string& platform, const model::IngestOptions& options,
                         ProgressSink& sink, const CancellationToken& token);

  model::MediaRecord BuildRecord(const std::string& url, const std::string& platform, const model::IngestOptions& options,
                                 const ExtractorResult& result, const std::filesystem::path& final_path,
                                 const std::string& content_hash) const;

  std::vector<std::filesystem::path> PersistSideEffects(model::MediaRecord& record, const ExtractorResult& result);

  std::shared_ptr<std::timed_mutex> UrlMutex(const std::string& url);
  void                              ReleaseUrlMutex(const std::string& url);

  std::shared_ptr<library::LibraryStore>      store_;
  std::shared_ptr<Extractor>                  extractor_;
  DestinationResolver                         resolver_;
  PipelineOptions                             options_;
  std::shared_ptr<ThumbnailCache>             thumbnails_;
  std::vector<std::shared_ptr<SidecarWriter>> sidecars_;
  OutputLocator                               locator_;

  std::mutex                                                         url_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> url_mutexes_;
};

} // namespace zget::ingest
