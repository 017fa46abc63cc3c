#pragma once

#include <string>
#include <string_view>

namespace zget::runtime::config {
class ObservabilityConfig;
}

namespace zget::observability {

/*
  Collector endpoint for one OTLP signal ("traces" or "metrics"), first match wins:
    observability.otlp_endpoint
    OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT
    OTEL_EXPORTER_OTLP_ENDPOINT
    localhost:4317 (gRPC) or http://localhost:4318/v1/<signal> (HTTP)
*/
std::string ResolveOtlpEndpoint(const zget::runtime::config::ObservabilityConfig& config, std::string_view signal);

bool UsesOtlpHttp(const zget::runtime::config::ObservabilityConfig& config);

// gRPC channels use TLS only for https:// endpoints.
bool UsesOtlpTls(std::string_view endpoint);

} // namespace zget::observability
