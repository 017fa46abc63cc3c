#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/ingest/destination_resolver.hpp"
#include "internal/ingest/process_extractor.hpp"
#include "internal/ingest/side_persistence.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace zget::factory {

namespace {

void EnsureDirectory(const std::string& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw util::IOError("create " + dir + ": " + ec.message());
  }
}

} // namespace

std::shared_ptr<library::LibraryStore> BuildLibraryStore(const zget::runtime::config::RuntimeConfig& config) {
  const auto& sqlite = config.database().sqlite();
  const auto  parent = std::filesystem::path(sqlite.path()).parent_path();
  if (!parent.empty()) {
    EnsureDirectory(parent.string());
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.busy_timeout_ms());
  db::sqlite::BootstrapSchema(sqlite_db);
  auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));

  ZGET_LOG_DEBUG("library opened", {observability::StringField("path", sqlite.path())});
  return std::make_shared<library::LibraryStore>(std::move(repository));
}

/*
    Build full application dependency graph
*/
Application Build(const zget::runtime::config::RuntimeConfig& config, std::shared_ptr<queue::QueueObserver> observer,
                  std::shared_ptr<ingest::Extractor> extractor) {
  Application app;
  const auto& library = config.library();

  EnsureDirectory(library.videos_dir());
  EnsureDirectory(library.temp_dir());

  // ------------------------------------------------------------------
  // Library
  // ------------------------------------------------------------------
  app.store = BuildLibraryStore(config);

  // ------------------------------------------------------------------
  // Extractor
  // ------------------------------------------------------------------
  if (extractor) {
    app.extractor = std::move(extractor);
  } else {
    ingest::ProcessExtractor::Options extractor_options;
    extractor_options.command = config.extractor().command();
    extractor_options.extra_args.assign(config.extractor().extra_args().begin(), config.extractor().extra_args().end());
    app.extractor = std::make_shared<ingest::ProcessExtractor>(std::move(extractor_options));
  }

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  const auto& ingest = config.ingest();

  ingest::PipelineOptions pipeline_options;
  pipeline_options.temp_dir           = library.temp_dir();
  pipeline_options.check_url          = !ingest.disable_url_check();
  pipeline_options.check_hash         = !ingest.disable_hash_check();
  pipeline_options.store_raw_metadata = !ingest.disable_raw_metadata();
  pipeline_options.hash_chunk_bytes   = static_cast<std::size_t>(ingest.hash_chunk_bytes());
  pipeline_options.max_quality        = config.extractor().max_quality();

  std::vector<std::shared_ptr<ingest::SidecarWriter>> sidecars;
  if (ingest.auto_export_json()) {
    sidecars.push_back(std::make_shared<ingest::JsonExportWriter>(library.exports_dir()));
  }

  app.pipeline = std::make_shared<ingest::IngestPipeline>(app.store, app.extractor,
                                                          ingest::DestinationResolver(library.videos_dir(), library.flat_structure()),
                                                          std::move(pipeline_options),
                                                          std::make_shared<ingest::LocalThumbnailCache>(library.thumbnails_dir()),
                                                          std::move(sidecars));

  // ------------------------------------------------------------------
  // Queue
  // ------------------------------------------------------------------
  queue::QueueOptions queue_options;
  queue_options.max_concurrent = config.queue().max_concurrent();
  queue_options.stale_after    = std::chrono::seconds(config.queue().stale_after_sec());
  app.queue                    = std::make_shared<queue::AcquisitionQueue>(app.pipeline, queue_options, std::move(observer));

  return app;
}

} // namespace zget::factory
