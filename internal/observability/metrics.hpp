#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace routebroker::runtime::config {
class RuntimeConfig;
}

namespace routebroker::observability {

// Installs the OTLP metric exporter when observability.metrics_enabled is set.
bool InitializeMetrics(const routebroker::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Broker instruments. All names are prefixed "routebroker.".

    rpc.count / rpc.latency_ms      per rpc, with ok=true|false
    route.requests                  per disposition
    route.computation.duration_ms   per final job state
    route.evaluations               with mesh_found=true|false
    mesh.imported, job.requeued     plain counters
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRpc(std::string_view rpc, bool ok, double latency_ms);

  // disposition: "dispatched", "existing" or "no_mesh"
  void RecordRouteRequest(std::string_view disposition);

  // job_state: SUCCESS or FAILURE
  void ObserveComputation(std::string_view job_state, double duration_ms);

  void RecordRouteEvaluation(bool mesh_found);
  void RecordMeshesImported(std::uint64_t count);
  void RecordJobsRequeued(std::uint64_t count);

 private:
  Metrics();
#ifdef ROUTEBROKER_ENABLE_OTEL
  struct Instruments;
  std::unique_ptr<Instruments> instruments_;
#endif
};

#ifndef ROUTEBROKER_ENABLE_OTEL
inline bool InitializeMetrics(const routebroker::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, bool, double) {
}

inline void Metrics::RecordRouteRequest(std::string_view) {
}

inline void Metrics::ObserveComputation(std::string_view, double) {
}

inline void Metrics::RecordRouteEvaluation(bool) {
}

inline void Metrics::RecordMeshesImported(std::uint64_t) {
}

inline void Metrics::RecordJobsRequeued(std::uint64_t) {
}
#endif

} // namespace routebroker::observability
