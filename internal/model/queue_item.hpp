#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace zget::model {

enum class QueueStatus : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kComplete  = 2,
  kFailed    = 3,
  kCancelled = 4,
};

constexpr std::string_view ToString(QueueStatus status) {
  switch (status) {
    case QueueStatus::kPending:
      return "pending";
    case QueueStatus::kRunning:
      return "running";
    case QueueStatus::kComplete:
      return "complete";
    case QueueStatus::kFailed:
      return "failed";
    case QueueStatus::kCancelled:
    default:
      return "cancelled";
  }
}

constexpr bool IsTerminal(QueueStatus status) {
  return status == QueueStatus::kComplete || status == QueueStatus::kFailed || status == QueueStatus::kCancelled;
}

constexpr bool CanTransition(QueueStatus from, QueueStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == QueueStatus::kPending) {
    return to == QueueStatus::kRunning || to == QueueStatus::kCancelled;
  }
  // running
  return IsTerminal(to);
}

struct IngestOptions {
  std::string              format_id;
  std::string              destination; // overrides the per-platform directory
  std::vector<std::string> tags;
  std::string              collection;
  bool                     skip_duplicate_check = false;
};

struct Progress {
  uint64_t                downloaded_bytes = 0;
  std::optional<uint64_t> total_bytes;
  double                  rate_bytes_per_sec = 0.0;
  std::optional<int64_t>  eta_seconds;
  double                  percent = 0.0;
};

/*
  In-memory acquisition state. Callers only ever hold copies.
*/
struct QueueItem {
  std::string id;
  std::string url;
  std::string platform;

  QueueStatus   status = QueueStatus::kPending;
  Progress      progress;
  IngestOptions options;

  // set on kComplete
  std::optional<int64_t> record_id;
  std::string            local_path;
  std::string            title;
  std::string            uploader;

  // set on kFailed; error_kind is for presentation only
  std::string error;
  std::string error_kind;

  util::TimePoint                created_at{};
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> completed_at;
};

} // namespace zget::model
