#pragma once

#include <atomic>
#include <string>

#include "internal/util/errors.hpp"

namespace zget::ingest {

/*
  Cooperative cancellation flag shared between the queue and one run.
  The run polls it at fixed checkpoints.
*/
class CancellationToken {
 public:
  void Cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

  void ThrowIfCancelled(const std::string& where) const {
    if (IsCancelled()) {
      throw util::CancelledError("cancelled during " + where);
    }
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace zget::ingest
