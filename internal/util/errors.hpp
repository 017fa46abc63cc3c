#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zget::util {

/*
  Central error types.

  Everything below the queue reports failures by throwing one of these.
  The queue records what() on the item and never interprets the type.
*/

enum class DuplicateKind {
  kUrl,
  kContentHash,
  kSourceId,
};

inline std::string_view ToString(DuplicateKind kind) {
  switch (kind) {
    case DuplicateKind::kUrl:
      return "url";
    case DuplicateKind::kContentHash:
      return "content_hash";
    case DuplicateKind::kSourceId:
      return "source_id";
  }
  return "unknown";
}

/*
  Expected outcome, not a bug. Carries which identity collided and,
  when it could be looked up, the id of the record already in the library.
*/
class DuplicateError : public std::runtime_error {
 public:
  DuplicateError(DuplicateKind kind, const std::string& msg, std::optional<int64_t> existing_id = std::nullopt)
      : std::runtime_error(msg), kind_(kind), existing_id_(existing_id) {
  }

  DuplicateKind Kind() const {
    return kind_;
  }

  const std::optional<int64_t>& ExistingId() const {
    return existing_id_;
  }

 private:
  DuplicateKind          kind_;
  std::optional<int64_t> existing_id_;
};

// The extractor could not produce a file (network, site, format negotiation).
class ExtractionError : public std::runtime_error {
 public:
  explicit ExtractionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Local filesystem failure: missing output, failed move, failed hash.
class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Storage failure that is not a uniqueness violation.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A run observed its cancellation token and unwound.
class CancelledError : public std::runtime_error {
 public:
  explicit CancelledError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace zget::util
