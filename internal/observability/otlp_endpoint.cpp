#include "internal/observability/otlp_endpoint.hpp"

#ifdef ROUTEBROKER_ENABLE_OTEL

#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace routebroker::observability {
namespace {

std::string SignalEnvVar(std::string_view signal) {
  std::string name = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) {
    name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return name + "_ENDPOINT";
}

std::string FromEnvironment(std::string_view signal) {
  if (const char* value = std::getenv(SignalEnvVar(signal).c_str())) {
    return value;
  }
  if (const char* value = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return value;
  }
  return {};
}

} // namespace

OtlpEndpoint ResolveOtlpEndpoint(const routebroker::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  OtlpEndpoint endpoint;
  endpoint.http    = config.transport() == routebroker::runtime::config::OTLP_TRANSPORT_HTTP;
  endpoint.address = config.otlp_endpoint().empty() ? FromEnvironment(signal) : config.otlp_endpoint();

  if (endpoint.address.empty()) {
    endpoint.address = endpoint.http ? "http://localhost:4318/v1/" + std::string(signal) : "localhost:4317";
  }
  endpoint.secure = endpoint.address.rfind("https://", 0) == 0;
  return endpoint;
}

opentelemetry::sdk::resource::Resource BrokerResource() {
  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", "route-broker"}, {"service.version", "0.1.0"}};
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace routebroker::observability

#endif
