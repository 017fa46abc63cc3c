#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/ingest/extractor.hpp"
#include "internal/ingest/ingest_pipeline.hpp"
#include "internal/library/library_store.hpp"
#include "internal/queue/acquisition_queue.hpp"
#include "internal/queue/queue_observer.hpp"

namespace zget::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the lifetime
  of the process. The queue is built but not started.
*/
struct Application {
  std::shared_ptr<library::LibraryStore>   store;
  std::shared_ptr<ingest::Extractor>       extractor;
  std::shared_ptr<ingest::IngestPipeline>  pipeline;
  std::shared_ptr<queue::AcquisitionQueue> queue;
};

// Opens (and bootstraps) the library database only.
std::shared_ptr<library::LibraryStore> BuildLibraryStore(const zget::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the whole ingest stack from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and extractor types.
  extractor overrides the configured downloader process (tests, embedding).
*/
Application Build(const zget::runtime::config::RuntimeConfig& config, std::shared_ptr<queue::QueueObserver> observer = nullptr,
                  std::shared_ptr<ingest::Extractor> extractor = nullptr);

} // namespace zget::factory
