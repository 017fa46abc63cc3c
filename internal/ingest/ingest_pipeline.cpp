#include "ingest_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>

#include "internal/model/platform.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/file_placement.hpp"
#include "internal/storage/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "internal/util/time.hpp"

namespace zget::ingest {

namespace fs = std::filesystem;
using observability::IntField;
using observability::StringField;

namespace {

constexpr auto kUrlLockPoll = std::chrono::milliseconds(100);

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

/*
  Removes files this run put in place unless Release() is called.
  Covers every failure after placement, including cancellation.
*/
class PlacedFiles {
 public:
  PlacedFiles() = default;
  ~PlacedFiles() {
    for (const auto& path : paths_) {
      storage::RemoveFile(path);
    }
  }

  PlacedFiles(const PlacedFiles&)            = delete;
  PlacedFiles& operator=(const PlacedFiles&) = delete;

  void Add(fs::path path) {
    paths_.push_back(std::move(path));
  }

  void Release() {
    paths_.clear();
  }

 private:
  std::vector<fs::path> paths_;
};

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string ResolveUploader(const std::string& uploader, const std::string& platform) {
  const auto lowered = Lower(uploader);
  if (uploader.empty() || lowered == "unknown" || lowered == "null" || lowered == "none") {
    return platform == "c-span" ? "C-SPAN" : "unknown";
  }
  return uploader;
}

std::string FormatResolution(const ExtractorResult& result) {
  const auto side = [](const std::optional<int64_t>& v) { return v ? std::to_string(*v) : std::string("?"); };
  return side(result.width) + "x" + side(result.height);
}

} // namespace

IngestPipeline::IngestPipeline(std::shared_ptr<library::LibraryStore> store, std::shared_ptr<Extractor> extractor,
                               DestinationResolver resolver, PipelineOptions options, std::shared_ptr<ThumbnailCache> thumbnails,
                               std::vector<std::shared_ptr<SidecarWriter>> sidecars)
    : store_(std::move(store)),
      extractor_(std::move(extractor)),
      resolver_(std::move(resolver)),
      options_(std::move(options)),
      thumbnails_(std::move(thumbnails)),
      sidecars_(std::move(sidecars)) {
  if (!store_ || !extractor_) {
    throw util::InvalidArgument("ingest pipeline requires a library store and an extractor");
  }
  if (options_.temp_dir.empty()) {
    options_.temp_dir = fs::temp_directory_path();
  }
}

std::shared_ptr<std::timed_mutex> IngestPipeline::UrlMutex(const std::string& url) {
  std::lock_guard<std::mutex> lock(url_mutexes_guard_);
  auto&                       url_mutex = url_mutexes_[url];
  if (!url_mutex) {
    url_mutex = std::make_shared<std::timed_mutex>();
  }
  return url_mutex;
}

void IngestPipeline::ReleaseUrlMutex(const std::string& url) {
  std::lock_guard<std::mutex> lock(url_mutexes_guard_);
  auto                        it = url_mutexes_.find(url);
  // only the map still refers to it: nobody holds or waits on it
  if (it != url_mutexes_.end() && it->second.use_count() == 1) {
    url_mutexes_.erase(it);
  }
}

model::MediaRecord IngestPipeline::Ingest(const std::string& url, const model::IngestOptions& options, ProgressSink& sink,
                                          const CancellationToken& token) {
  observability::SpanScope span("ingest.run");
  span.SetAttribute("url", url);

  const auto started  = std::chrono::steady_clock::now();
  const auto platform = model::DetectPlatform(url);
  span.SetAttribute("platform", platform);

  auto& metrics = observability::Metrics::Instance();
  try {
    auto record = Run(url, platform, options, sink, token);
    metrics.RecordIngest(platform, "complete");
    metrics.ObserveIngestDurationMs(platform, ElapsedMs(started));
    return record;
  } catch (const util::DuplicateError& e) {
    metrics.RecordIngest(platform, "duplicate");
    ZGET_LOG_INFO("ingest skipped duplicate", {StringField("url", url), StringField("kind", util::ToString(e.Kind()))});
    throw;
  } catch (const util::CancelledError& e) {
    metrics.RecordIngest(platform, "cancelled");
    ZGET_LOG_INFO("ingest cancelled", {StringField("url", url), StringField("where", e.what())});
    throw;
  } catch (const std::exception& e) {
    metrics.RecordIngest(platform, "failed");
    span.RecordException(e.what());
    ZGET_LOG_WARN("ingest failed", {StringField("url", url), StringField("error", e.what())});
    throw;
  }
}

model::MediaRecord IngestPipeline::Run(const std::string& url, const std::string& platform, const model::IngestOptions& options,
                                       ProgressSink& sink, const CancellationToken& token) {
  // 0. serialize runs for this URL so the pre-check sees an earlier run's commit
  auto                               url_mutex = UrlMutex(url);
  std::unique_lock<std::timed_mutex> url_lock(*url_mutex, std::defer_lock);
  struct UrlMutexRelease {
    IngestPipeline*                     pipeline;
    const std::string&                  url;
    std::shared_ptr<std::timed_mutex>&  mutex;
    std::unique_lock<std::timed_mutex>& lock;
    ~UrlMutexRelease() {
      if (lock.owns_lock()) lock.unlock();
      mutex.reset();
      pipeline->ReleaseUrlMutex(url);
    }
  } url_release{this, url, url_mutex, url_lock};

  while (!url_lock.try_lock_for(kUrlLockPoll)) {
    token.ThrowIfCancelled("admission");
  }

  // 1. pre-check
  if (!options.skip_duplicate_check && options_.check_url) {
    if (auto existing = store_->FindByUrl(url)) {
      throw util::DuplicateError(util::DuplicateKind::kUrl, "URL already in library", existing->id);
    }
  }

  // 2. destination
  const auto dest_dir = resolver_.Resolve(platform, options.destination);

  // 3. download into a private directory; removed on every exit path
  token.ThrowIfCancelled("download");
  storage::ScopedTempDir work_dir(options_.temp_dir);
  ZGET_LOG_INFO("ingest started", {StringField("url", url), StringField("platform", platform), StringField("path", work_dir.Path().string())});

  ExtractRequest request;
  request.url         = url;
  request.work_dir    = work_dir.Path();
  request.format_id   = options.format_id;
  request.max_quality = options_.max_quality;
  auto result         = extractor_->Extract(request, sink, token);

  // 4. locate
  token.ThrowIfCancelled("locate");
  const auto located = locator_.Locate(work_dir.Path(), result);

  // 5. atomic placement
  token.ThrowIfCancelled("placement");
  auto filename = storage::SanitizeFilename(located.filename().string());
  if (filename.empty() || filename == located.extension().string()) {
    filename = "media" + located.extension().string();
  }
  PlacedFiles placed;
  const auto  final_path = storage::MoveIntoPlace(located, dest_dir, filename);
  placed.Add(final_path);

  // 6. hash
  token.ThrowIfCancelled("hashing");
  const auto hash_started = std::chrono::steady_clock::now();
  const auto content_hash = util::HashFile(final_path, options_.hash_chunk_bytes);
  observability::Metrics::Instance().ObserveHashDurationMs(ElapsedMs(hash_started));

  // 7. post-check
  token.ThrowIfCancelled("dedup");
  if (options_.check_hash) {
    if (auto existing = store_->FindByHash(content_hash)) {
      throw util::DuplicateError(util::DuplicateKind::kContentHash, "File content already in library", existing->id);
    }
  }

  auto record = BuildRecord(url, platform, options, result, final_path, content_hash);

  // 8. side persistence; never fails the run
  token.ThrowIfCancelled("side persistence");
  for (auto& written : PersistSideEffects(record, result)) {
    placed.Add(std::move(written));
  }

  // 9. commit
  token.ThrowIfCancelled("commit");
  record.id = store_->Insert(record);

  if (token.IsCancelled()) {
    // compensate: a cancelled run leaves no record behind
    store_->Delete(record.id);
    throw util::CancelledError("cancelled after commit");
  }

  placed.Release();
  ZGET_LOG_INFO("ingest complete",
                {IntField("id", record.id), StringField("url", url), StringField("platform", platform), StringField("path", record.local_path)});
  return record;
}

model::MediaRecord IngestPipeline::BuildRecord(const std::string& url, const std::string& platform, const model::IngestOptions& options,
                                               const ExtractorResult& result, const fs::path& final_path,
                                               const std::string& content_hash) const {
  model::MediaRecord record;
  record.source_url = url;
  record.platform   = platform;
  // without a source id the url is the only identity
  record.source_id   = result.source_id.empty() ? url : result.source_id;
  record.title       = result.title.empty() ? "Untitled" : result.title;
  record.description = result.description;
  record.uploader    = ResolveUploader(result.uploader, platform);
  record.uploader_id = result.uploader_id;
  record.upload_date = util::ParseUploadDate(result.upload_date);
  if (result.duration) {
    record.duration_seconds = static_cast<int64_t>(*result.duration);
  }
  record.view_count    = result.view_count;
  record.like_count    = result.like_count;
  record.comment_count = result.comment_count;
  record.resolution    = FormatResolution(result);
  record.fps           = result.fps;
  record.codec         = result.vcodec;

  std::error_code ec;
  const auto      size = fs::file_size(final_path, ec);
  if (ec) {
    throw util::IOError("stat " + final_path.string() + ": " + ec.message());
  }
  record.file_size_bytes = size;
  record.content_hash    = content_hash;
  record.local_path      = fs::absolute(final_path).string();
  record.ingested_at     = util::Now();
  record.tags            = options.tags;
  record.collection      = options.collection;
  if (options_.store_raw_metadata) {
    record.raw_json = result.raw_json;
  }
  return record;
}

std::vector<fs::path> IngestPipeline::PersistSideEffects(model::MediaRecord& record, const ExtractorResult& result) {
  std::vector<fs::path> written;

  if (thumbnails_) {
    try {
      if (auto thumbnail = thumbnails_->Cache(record, result)) {
        record.thumbnail_path = thumbnail->string();
        written.push_back(*thumbnail);
      }
    } catch (const std::exception& e) {
      ZGET_LOG_WARN("thumbnail cache failed", {StringField("url", record.source_url), StringField("error", e.what())});
    }
  }

  for (const auto& sidecar : sidecars_) {
    try {
      written.push_back(sidecar->Write(record));
    } catch (const std::exception& e) {
      ZGET_LOG_WARN("sidecar write failed", {StringField("url", record.source_url), StringField("error", e.what())});
    }
  }
  return written;
}

} // namespace zget::ingest
