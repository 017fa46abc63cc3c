#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/ingest/cancellation.hpp"
#include "internal/ingest/ingest_pipeline.hpp"
#include "internal/model/queue_item.hpp"
#include "queue_observer.hpp"

namespace zget::queue {

struct QueueOptions {
  uint32_t             max_concurrent = 32;
  std::chrono::seconds stale_after{0}; // 0 keeps finished items until cleared
};

/*
  Acquisition Queue

  Accepts URLs and runs each through the ingest pipeline with at most
  max_concurrent runs in flight. One dispatch thread admits Pending items in
  FIFO order as slots free up; every admitted run gets its own worker thread.

  State machine:
      Pending -> Running -> Complete | Failed | Cancelled
      Pending -> Cancelled

  Everything returned to callers is a copy.
*/
class AcquisitionQueue {
 public:
  AcquisitionQueue(std::shared_ptr<ingest::IngestPipeline> pipeline, QueueOptions options,
                   std::shared_ptr<QueueObserver> observer = nullptr);
  ~AcquisitionQueue();

  AcquisitionQueue(const AcquisitionQueue&)            = delete;
  AcquisitionQueue& operator=(const AcquisitionQueue&) = delete;

  void Start();

  // Cancels running items and joins every thread. Pending items stay Pending.
  void Stop();

  model::QueueItem              Enqueue(const std::string& url, const model::IngestOptions& options = {});
  std::vector<model::QueueItem> EnqueueBatch(const std::vector<std::string>& urls, const model::IngestOptions& options = {});

  /*
    Pending items become Cancelled at once. For a Running item this only
    delivers the request; a run that already committed its record when the
    request lands still ends Complete. Either way the final status matches
    the library: Cancelled leaves no record, Complete has one.
    false when the item is unknown or already finished.
  */
  bool Cancel(const std::string& id);

  // Cancels, then forgets the item. Returns whether an item was dropped.
  bool Remove(const std::string& id);

  std::size_t ClearCompleted();
  std::size_t ExpireStale(std::chrono::seconds max_age);

  std::optional<model::QueueItem> Get(const std::string& id) const;
  std::vector<model::QueueItem>   Items() const; // creation order

  std::size_t PendingCount() const;
  std::size_t RunningCount() const;
  std::size_t CompleteCount() const;
  std::size_t FailedCount() const;
  std::size_t CancelledCount() const;

  // Blocks until nothing is Pending or Running. false on timeout.
  bool WaitIdle(std::chrono::milliseconds timeout);

 private:
  struct Entry {
    model::QueueItem          item;
    ingest::CancellationToken token;
  };
  class ItemSink;

  void DispatchLoop();
  void RunItem(std::shared_ptr<Entry> entry);
  void ApplyProgress(const std::shared_ptr<Entry>& entry, const model::Progress& progress);
  void Finish(const std::shared_ptr<Entry>& entry, model::QueueStatus status, std::string error, std::string error_kind);

  void        JoinFinishedLocked(std::unique_lock<std::mutex>& lock);
  std::size_t CountLocked(model::QueueStatus status) const;
  template <typename Predicate>
  std::size_t EraseIfLocked(Predicate predicate);
  std::size_t ExpireStaleLocked(std::chrono::seconds max_age);
  bool        IdleLocked() const;
  void        PublishDepthLocked() const;

  std::shared_ptr<ingest::IngestPipeline> pipeline_;
  QueueOptions                            options_;
  std::shared_ptr<QueueObserver>          observer_;

  mutable std::mutex                                      mutex_;
  std::condition_variable                                 cv_;
  std::condition_variable                                 idle_cv_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  std::vector<std::string>                                order_;
  std::deque<std::string>                                 pending_;

  uint32_t                                     active_runs_ = 0;
  std::unordered_map<std::string, std::thread> workers_;
  std::vector<std::string>                     finished_workers_;

  std::thread dispatcher_;
  bool        started_  = false;
  bool        stopping_ = false;
};

} // namespace zget::queue
