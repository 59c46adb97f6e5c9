#pragma once

#ifdef ROUTEBROKER_ENABLE_OTEL

#include <string>
#include <string_view>

#include <opentelemetry/sdk/resource/resource.h>

namespace routebroker::runtime::config {
class ObservabilityConfig;
}

namespace routebroker::observability {

struct OtlpEndpoint {
  std::string address;
  bool        http   = false;  // OTLP/HTTP protobuf instead of OTLP/gRPC
  bool        secure = false;  // https:// address
};

// Endpoint for one signal ("traces" or "metrics"). Precedence:
// observability.otlp_endpoint, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector's local default port.
OtlpEndpoint ResolveOtlpEndpoint(const routebroker::runtime::config::ObservabilityConfig& config, std::string_view signal);

// service.name / service.version attached to every exported batch.
opentelemetry::sdk::resource::Resource BrokerResource();

} // namespace routebroker::observability

#endif
