#include "internal/observability/tracing.hpp"

#ifdef ROUTEBROKER_ENABLE_OTEL

#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_endpoint.hpp"

namespace routebroker::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider> g_provider;

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer("route-broker", "0.1.0");
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpEndpoint& endpoint) {
  if (endpoint.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint.address;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint.address;
  options.use_ssl_credentials = endpoint.secure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

template <std::size_t N>
void AppendHex(std::string& out, const uint8_t (&bytes)[N]) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
}

} // namespace

bool InitializeTracing(const routebroker::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  auto exporter  = MakeExporter(ResolveOtlpEndpoint(config.observability(), "traces"));
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  g_provider     = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), BrokerResource()));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  return true;
}

void ShutdownTracing() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

std::string CurrentTraceContext() {
  auto context = trace_api::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent())->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_id[trace_api::TraceId::kSize];
  uint8_t span_id[trace_api::SpanId::kSize];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);

  std::string out = "trace_id=";
  AppendHex(out, trace_id);
  out += " span_id=";
  AppendHex(out, span_id);
  return out;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(std::move(s)), scope(span) {
  }
};

SpanScope::SpanScope(std::string_view name)
    : impl_(std::make_unique<Impl>(Tracer()->StartSpan(opentelemetry::nostd::string_view(name.data(), name.size())))) {
}

SpanScope::~SpanScope() {
  impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(opentelemetry::nostd::string_view(key.data(), key.size()),
                            opentelemetry::nostd::string_view(value.data(), value.size()));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  impl_->span->SetAttribute(opentelemetry::nostd::string_view(key.data(), key.size()), value);
}

void SpanScope::RecordError(std::string_view message) {
  impl_->span->AddEvent("route-broker.error", {{"message", opentelemetry::nostd::string_view(message.data(), message.size())}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, opentelemetry::nostd::string_view(message.data(), message.size()));
}

} // namespace routebroker::observability

#endif
