#include "acquisition_queue.hpp"

#include <algorithm>

#include "internal/model/platform.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace zget::queue {

using model::QueueItem;
using model::QueueStatus;
using observability::StringField;

namespace {

constexpr auto kSweepInterval = std::chrono::seconds(1);

template <typename Fn>
void Notify(const std::shared_ptr<QueueObserver>& observer, const QueueItem& item, Fn&& fn) {
  if (!observer) {
    return;
  }
  try {
    fn(*observer);
  } catch (const std::exception& e) {
    ZGET_LOG_WARN("queue observer failed", {StringField("item", item.id), StringField("error", e.what())});
  }
}

} // namespace

/*
  Feeds extractor progress into the item's state on the worker thread.
*/
class AcquisitionQueue::ItemSink final : public ingest::ProgressSink {
 public:
  ItemSink(AcquisitionQueue& queue, std::shared_ptr<Entry> entry) : queue_(queue), entry_(std::move(entry)) {
  }

  void OnProgress(const model::Progress& progress) override {
    queue_.ApplyProgress(entry_, progress);
  }

 private:
  AcquisitionQueue&      queue_;
  std::shared_ptr<Entry> entry_;
};

AcquisitionQueue::AcquisitionQueue(std::shared_ptr<ingest::IngestPipeline> pipeline, QueueOptions options,
                                   std::shared_ptr<QueueObserver> observer)
    : pipeline_(std::move(pipeline)), options_(options), observer_(std::move(observer)) {
  if (!pipeline_) {
    throw util::InvalidArgument("acquisition queue requires an ingest pipeline");
  }
  if (options_.max_concurrent == 0) {
    throw util::InvalidArgument("queue.max_concurrent must be at least 1");
  }
}

AcquisitionQueue::~AcquisitionQueue() {
  Stop();
}

void AcquisitionQueue::Start() {
  std::lock_guard lock(mutex_);
  if (started_) return;
  started_    = true;
  stopping_   = false;
  dispatcher_ = std::thread(&AcquisitionQueue::DispatchLoop, this);
}

void AcquisitionQueue::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!started_) return;
    stopping_ = true;
    for (auto& [id, entry] : entries_) {
      if (entry->item.status == QueueStatus::kRunning) {
        entry->token.Cancel();
      }
    }
  }
  cv_.notify_all();

  if (dispatcher_.joinable()) dispatcher_.join();

  std::unordered_map<std::string, std::thread> workers;
  {
    std::lock_guard lock(mutex_);
    workers.swap(workers_);
    finished_workers_.clear();
  }
  for (auto& [id, worker] : workers) {
    if (worker.joinable()) worker.join();
  }

  std::lock_guard lock(mutex_);
  started_ = false;
}

QueueItem AcquisitionQueue::Enqueue(const std::string& url, const model::IngestOptions& options) {
  auto entry             = std::make_shared<Entry>();
  entry->item.id         = util::GenerateId();
  entry->item.url        = url;
  entry->item.platform   = model::DetectPlatform(url);
  entry->item.options    = options;
  entry->item.created_at = util::Now();
  const QueueItem snapshot = entry->item;

  {
    std::lock_guard lock(mutex_);
    entries_.emplace(snapshot.id, std::move(entry));
    order_.push_back(snapshot.id);
    pending_.push_back(snapshot.id);
    PublishDepthLocked();
  }
  cv_.notify_all();

  ZGET_LOG_INFO("queued", {StringField("item", snapshot.id), StringField("url", url), StringField("platform", snapshot.platform)});
  return snapshot;
}

std::vector<QueueItem> AcquisitionQueue::EnqueueBatch(const std::vector<std::string>& urls, const model::IngestOptions& options) {
  std::vector<QueueItem> items;
  items.reserve(urls.size());
  for (const auto& url : urls) {
    items.push_back(Enqueue(url, options));
  }
  return items;
}

bool AcquisitionQueue::Cancel(const std::string& id) {
  QueueItem snapshot;
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(id);
    if (it == entries_.end()) return false;

    auto& entry = it->second;
    switch (entry->item.status) {
      case QueueStatus::kRunning:
        // the worker records Cancelled once the run has unwound
        entry->token.Cancel();
        return true;
      case QueueStatus::kPending:
        entry->token.Cancel();
        entry->item.status       = QueueStatus::kCancelled;
        entry->item.completed_at = util::Now();
        pending_.erase(std::remove(pending_.begin(), pending_.end(), id), pending_.end());
        snapshot = entry->item;
        PublishDepthLocked();
        break;
      default:
        return false;
    }
  }
  idle_cv_.notify_all();

  ZGET_LOG_INFO("cancelled before start", {StringField("item", id), StringField("url", snapshot.url)});
  Notify(observer_, snapshot, [&](QueueObserver& o) { o.OnCancelled(snapshot); });
  return true;
}

bool AcquisitionQueue::Remove(const std::string& id) {
  Cancel(id);

  std::lock_guard lock(mutex_);
  if (entries_.erase(id) == 0) return false;
  order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
  return true;
}

template <typename Predicate>
std::size_t AcquisitionQueue::EraseIfLocked(Predicate predicate) {
  std::size_t removed = 0;
  for (auto it = order_.begin(); it != order_.end();) {
    auto entry = entries_.find(*it);
    if (entry == entries_.end() || predicate(entry->second->item)) {
      if (entry != entries_.end()) {
        entries_.erase(entry);
        ++removed;
      }
      it = order_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t AcquisitionQueue::ClearCompleted() {
  std::lock_guard lock(mutex_);
  return EraseIfLocked([](const QueueItem& item) { return model::IsTerminal(item.status); });
}

std::size_t AcquisitionQueue::ExpireStaleLocked(std::chrono::seconds max_age) {
  const auto cutoff = util::Now() - max_age;
  return EraseIfLocked(
      [cutoff](const QueueItem& item) { return model::IsTerminal(item.status) && item.completed_at && *item.completed_at < cutoff; });
}

std::size_t AcquisitionQueue::ExpireStale(std::chrono::seconds max_age) {
  std::lock_guard lock(mutex_);
  return ExpireStaleLocked(max_age);
}

std::optional<QueueItem> AcquisitionQueue::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  return it->second->item;
}

std::vector<QueueItem> AcquisitionQueue::Items() const {
  std::lock_guard        lock(mutex_);
  std::vector<QueueItem> items;
  items.reserve(order_.size());
  for (const auto& id : order_) {
    auto it = entries_.find(id);
    if (it != entries_.end()) items.push_back(it->second->item);
  }
  return items;
}

std::size_t AcquisitionQueue::CountLocked(QueueStatus status) const {
  return static_cast<std::size_t>(
      std::count_if(entries_.begin(), entries_.end(), [status](const auto& kv) { return kv.second->item.status == status; }));
}

std::size_t AcquisitionQueue::PendingCount() const {
  std::lock_guard lock(mutex_);
  return CountLocked(QueueStatus::kPending);
}

std::size_t AcquisitionQueue::RunningCount() const {
  std::lock_guard lock(mutex_);
  return CountLocked(QueueStatus::kRunning);
}

std::size_t AcquisitionQueue::CompleteCount() const {
  std::lock_guard lock(mutex_);
  return CountLocked(QueueStatus::kComplete);
}

std::size_t AcquisitionQueue::FailedCount() const {
  std::lock_guard lock(mutex_);
  return CountLocked(QueueStatus::kFailed);
}

std::size_t AcquisitionQueue::CancelledCount() const {
  std::lock_guard lock(mutex_);
  return CountLocked(QueueStatus::kCancelled);
}

bool AcquisitionQueue::IdleLocked() const {
  return active_runs_ == 0 && CountLocked(QueueStatus::kPending) == 0 && CountLocked(QueueStatus::kRunning) == 0;
}

bool AcquisitionQueue::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [&] { return IdleLocked(); });
}

void AcquisitionQueue::PublishDepthLocked() const {
  auto& metrics = observability::Metrics::Instance();
  metrics.SetQueueDepth("pending", CountLocked(QueueStatus::kPending));
  metrics.SetQueueDepth("running", CountLocked(QueueStatus::kRunning));
}

// ------------------------------------------------------------------
// Dispatch
// ------------------------------------------------------------------

void AcquisitionQueue::JoinFinishedLocked(std::unique_lock<std::mutex>& lock) {
  if (finished_workers_.empty()) return;

  std::vector<std::thread> done;
  for (const auto& id : finished_workers_) {
    auto it = workers_.find(id);
    if (it != workers_.end()) {
      done.push_back(std::move(it->second));
      workers_.erase(it);
    }
  }
  finished_workers_.clear();

  lock.unlock();
  for (auto& worker : done) {
    if (worker.joinable()) worker.join();
  }
  lock.lock();
}

void AcquisitionQueue::DispatchLoop() {
  std::unique_lock lock(mutex_);
  auto             next_sweep = std::chrono::steady_clock::now() + kSweepInterval;

  while (true) {
    cv_.wait_until(lock, next_sweep, [&] {
      return stopping_ || !finished_workers_.empty() || (!pending_.empty() && active_runs_ < options_.max_concurrent);
    });

    JoinFinishedLocked(lock);
    if (stopping_) break;

    if (std::chrono::steady_clock::now() >= next_sweep) {
      if (options_.stale_after.count() > 0) {
        ExpireStaleLocked(options_.stale_after);
      }
      next_sweep = std::chrono::steady_clock::now() + kSweepInterval;
    }

    // FIFO admission; Cancel() may already have taken an id out of Pending
    while (!pending_.empty() && active_runs_ < options_.max_concurrent) {
      const auto id = pending_.front();
      pending_.pop_front();

      auto it = entries_.find(id);
      if (it == entries_.end() || it->second->item.status != QueueStatus::kPending) continue;

      auto entry             = it->second;
      entry->item.status     = QueueStatus::kRunning;
      entry->item.started_at = util::Now();
      ++active_runs_;
      workers_.emplace(id, std::thread(&AcquisitionQueue::RunItem, this, entry));

      ZGET_LOG_INFO("admitted", {StringField("item", id), StringField("url", entry->item.url),
                                 observability::IntField("running", static_cast<std::int64_t>(active_runs_))});
    }
    PublishDepthLocked();
  }
}

// ------------------------------------------------------------------
// Worker
// ------------------------------------------------------------------

void AcquisitionQueue::ApplyProgress(const std::shared_ptr<Entry>& entry, const model::Progress& progress) {
  QueueItem snapshot;
  {
    std::lock_guard lock(mutex_);
    if (entry->item.status != QueueStatus::kRunning) return;
    entry->item.progress = progress;
    snapshot             = entry->item;
  }
  Notify(observer_, snapshot, [&](QueueObserver& o) { o.OnProgress(snapshot); });
}

void AcquisitionQueue::RunItem(std::shared_ptr<Entry> entry) {
  QueueItem started;
  {
    std::lock_guard lock(mutex_);
    started = entry->item;
  }
  Notify(observer_, started, [&](QueueObserver& o) { o.OnProgress(started); });

  ItemSink sink(*this, entry);
  try {
    auto record = pipeline_->Ingest(started.url, started.options, sink, entry->token);
    {
      std::lock_guard lock(mutex_);
      entry->item.record_id  = record.id;
      entry->item.local_path = record.local_path;
      entry->item.title      = record.title;
      entry->item.uploader   = record.uploader;
    }
    Finish(entry, QueueStatus::kComplete, {}, {});
  } catch (const util::CancelledError& e) {
    Finish(entry, QueueStatus::kCancelled, e.what(), "cancelled");
  } catch (const util::DuplicateError& e) {
    Finish(entry, QueueStatus::kFailed, e.what(), "duplicate");
  } catch (const util::ExtractionError& e) {
    Finish(entry, QueueStatus::kFailed, e.what(), "extraction");
  } catch (const util::IOError& e) {
    Finish(entry, QueueStatus::kFailed, e.what(), "io");
  } catch (const util::StoreError& e) {
    Finish(entry, QueueStatus::kFailed, e.what(), "store");
  } catch (const std::exception& e) {
    Finish(entry, QueueStatus::kFailed, e.what(), "internal");
  }
}

void AcquisitionQueue::Finish(const std::shared_ptr<Entry>& entry, QueueStatus status, std::string error, std::string error_kind) {
  QueueItem snapshot;
  bool      late_cancel = false;
  {
    std::lock_guard lock(mutex_);
    if (model::CanTransition(entry->item.status, status)) {
      entry->item.status       = status;
      entry->item.completed_at = util::Now();
      if (status == QueueStatus::kFailed) {
        entry->item.error      = std::move(error);
        entry->item.error_kind = std::move(error_kind);
      }
    }
    late_cancel = status == QueueStatus::kComplete && entry->token.IsCancelled();
    snapshot    = entry->item;
    --active_runs_;
    finished_workers_.push_back(snapshot.id);
    PublishDepthLocked();
  }
  cv_.notify_all();
  idle_cv_.notify_all();

  if (late_cancel) {
    ZGET_LOG_INFO("cancel arrived after commit, item stays complete", {StringField("item", snapshot.id)});
  }
  ZGET_LOG_INFO("finished", {StringField("item", snapshot.id), StringField("url", snapshot.url),
                             StringField("status", model::ToString(snapshot.status)), StringField("error", snapshot.error)});

  switch (snapshot.status) {
    case QueueStatus::kComplete:
      Notify(observer_, snapshot, [&](QueueObserver& o) { o.OnComplete(snapshot); });
      break;
    case QueueStatus::kFailed:
      Notify(observer_, snapshot, [&](QueueObserver& o) { o.OnError(snapshot, snapshot.error); });
      break;
    default:
      Notify(observer_, snapshot, [&](QueueObserver& o) { o.OnCancelled(snapshot); });
      break;
  }
}

} // namespace zget::queue
