#include "internal/observability/metrics.hpp"

#ifdef ROUTEBROKER_ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_endpoint.hpp"

namespace routebroker::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace nostd       = opentelemetry::nostd;

namespace {

constexpr std::uint32_t kDefaultExportIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpEndpoint& endpoint) {
  if (endpoint.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint.address;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint.address;
  options.use_ssl_credentials = endpoint.secure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

nostd::string_view View(std::string_view s) {
  return nostd::string_view(s.data(), s.size());
}

} // namespace

bool InitializeMetrics(const routebroker::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto interval_ms =
      observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : kDefaultExportIntervalMs;
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(interval_ms / 2);

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(ResolveOtlpEndpoint(observability, "metrics")),
                                                                           reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           BrokerResource());
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

struct Metrics::Instruments {
  nostd::shared_ptr<metrics_api::Meter> meter;

  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> route_requests;
  nostd::shared_ptr<metrics_api::Histogram<double>>      computation_ms;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> route_evaluations;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> meshes_imported;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> jobs_requeued;
};

// Instruments bind to the provider installed at first use; InitializeMetrics
// runs before any service is constructed.
Metrics::Metrics() : instruments_(std::make_unique<Instruments>()) {
  auto& i = *instruments_;
  i.meter = metrics_api::Provider::GetMeterProvider()->GetMeter("route-broker", "0.1.0");

  i.rpc_count         = i.meter->CreateUInt64Counter("routebroker.rpc.count", "Service calls", "1");
  i.rpc_latency_ms    = i.meter->CreateDoubleHistogram("routebroker.rpc.latency_ms", "Service call latency", "ms");
  i.route_requests    = i.meter->CreateUInt64Counter("routebroker.route.requests", "Route requests by disposition", "1");
  i.computation_ms    = i.meter->CreateDoubleHistogram("routebroker.route.computation.duration_ms", "Route computation time by final job state", "ms");
  i.route_evaluations = i.meter->CreateUInt64Counter("routebroker.route.evaluations", "Route evaluations", "1");
  i.meshes_imported   = i.meter->CreateUInt64Counter("routebroker.mesh.imported", "Meshes added by ingestion", "1");
  i.jobs_requeued     = i.meter->CreateUInt64Counter("routebroker.job.requeued", "Unfinished jobs queued again at startup", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view rpc, bool ok, double latency_ms) {
  const opentelemetry::context::Context context;
  instruments_->rpc_count->Add(1, {{"rpc", View(rpc)}, {"ok", ok}}, context);
  instruments_->rpc_latency_ms->Record(latency_ms, {{"rpc", View(rpc)}}, context);
}

void Metrics::RecordRouteRequest(std::string_view disposition) {
  instruments_->route_requests->Add(1, {{"disposition", View(disposition)}}, opentelemetry::context::Context{});
}

void Metrics::ObserveComputation(std::string_view job_state, double duration_ms) {
  instruments_->computation_ms->Record(duration_ms, {{"job.state", View(job_state)}}, opentelemetry::context::Context{});
}

void Metrics::RecordRouteEvaluation(bool mesh_found) {
  instruments_->route_evaluations->Add(1, {{"mesh_found", mesh_found}}, opentelemetry::context::Context{});
}

void Metrics::RecordMeshesImported(std::uint64_t count) {
  if (count > 0) {
    instruments_->meshes_imported->Add(count);
  }
}

void Metrics::RecordJobsRequeued(std::uint64_t count) {
  if (count > 0) {
    instruments_->jobs_requeued->Add(count);
  }
}

} // namespace routebroker::observability

#endif
