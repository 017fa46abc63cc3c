#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace zget::runtime::config {
class RuntimeConfig;
}

namespace zget::observability {

bool InitializeTracing(const zget::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const zget::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome: complete | duplicate | failed | cancelled
  void RecordIngest(std::string_view platform, std::string_view outcome);
  void ObserveIngestDurationMs(std::string_view platform, double duration_ms);
  void ObserveHashDurationMs(double duration_ms);

  // state: pending | running
  void SetQueueDepth(std::string_view state, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const zget::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const zget::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordIngest(std::string_view, std::string_view) {
}

inline void Metrics::ObserveIngestDurationMs(std::string_view, double) {
}

inline void Metrics::ObserveHashDurationMs(double) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace zget::observability
