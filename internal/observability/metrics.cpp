#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define ZGET_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ZGET_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace zget::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

bool StartExporter(const zget::runtime::config::ObservabilityConfig& config, std::chrono::milliseconds interval) {
  const auto endpoint = ResolveOtlpEndpoint(config, "metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (UsesOtlpHttp(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = UsesOtlpTls(endpoint);
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = interval;
#ifdef ZGET_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  const resource::ResourceAttributes attrs = {{"service.name", std::string("zget")}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> ingest_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      ingest_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      hash_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::mutex                                    queue_depth_mutex;
  std::unordered_map<std::string, std::int64_t> queue_depth_values;
};

bool InitializeMetrics(const zget::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto interval_ms = observability.metrics_interval_ms() > 0 ? observability.metrics_interval_ms() : 1000;
  return StartExporter(observability, std::chrono::milliseconds(interval_ms));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("zget", "0.1.0");

  impl_->ingest_count       = impl_->meter->CreateUInt64Counter("zget.ingest.count", "1", "Finished ingest runs by outcome");
  impl_->ingest_duration_ms = impl_->meter->CreateDoubleHistogram("zget.ingest.duration_ms", "ms", "Ingest run duration in milliseconds");
  impl_->hash_duration_ms   = impl_->meter->CreateDoubleHistogram("zget.ingest.hash_duration_ms", "ms", "Content hashing duration in milliseconds");
  impl_->queue_depth_gauge  = impl_->meter->CreateInt64ObservableGauge("zget.queue.depth", "Acquisition queue items by state", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [queue_state, count] : impl->queue_depth_values) {
          const std::initializer_list<AttributePair> attributes = {{"state", queue_state}};
          int_result->Observe(count, attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordIngest(std::string_view platform, std::string_view outcome) {
  if (!impl_ || !impl_->ingest_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"platform", std::string(platform)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->ingest_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveIngestDurationMs(std::string_view platform, double duration_ms) {
  if (!impl_ || !impl_->ingest_duration_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"platform", std::string(platform)}};
  RecordWithAttributes(impl_->ingest_duration_ms, duration_ms, attributes);
}

void Metrics::ObserveHashDurationMs(double duration_ms) {
  if (!impl_ || !impl_->hash_duration_ms) {
    return;
  }

  RecordWithAttributes(impl_->hash_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::SetQueueDepth(std::string_view state, std::uint64_t count) {
  if (!impl_ || !impl_->queue_depth_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depth_values[std::string(state)] = static_cast<std::int64_t>(count);
}

} // namespace zget::observability

#endif
