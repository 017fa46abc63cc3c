#pragma once

#include <string>

#include "internal/model/queue_item.hpp"

namespace zget::queue {

/*
  Receives item lifecycle events. Always called with a snapshot, never with
  the queue lock held, and in status order for any one item. Calls for
  different items may arrive concurrently from different worker threads.
*/
class QueueObserver {
 public:
  virtual ~QueueObserver() = default;

  virtual void OnProgress(const model::QueueItem&) {
  }
  virtual void OnComplete(const model::QueueItem&) {
  }
  virtual void OnError(const model::QueueItem&, const std::string& /*message*/) {
  }
  virtual void OnCancelled(const model::QueueItem&) {
  }
};

} // namespace zget::queue
