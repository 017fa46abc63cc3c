#include "internal/observability/otlp.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace zget::observability {

std::string ResolveOtlpEndpoint(const zget::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  std::string signal_var = "OTEL_EXPORTER_OTLP_" + std::string(signal) + "_ENDPOINT";
  std::transform(signal_var.begin(), signal_var.end(), signal_var.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (const char* endpoint = std::getenv(signal_var.c_str())) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return UsesOtlpHttp(config) ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
}

bool UsesOtlpHttp(const zget::runtime::config::ObservabilityConfig& config) {
  return config.transport() == zget::runtime::config::OTLP_TRANSPORT_HTTP;
}

bool UsesOtlpTls(std::string_view endpoint) {
  return endpoint.rfind("https://", 0) == 0;
}

} // namespace zget::observability
