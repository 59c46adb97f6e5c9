#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace {

using namespace routebroker::observability;

std::shared_ptr<std::ostringstream> CaptureDefaultLogger(spdlog::level::level_enum level) {
  auto out    = std::make_shared<std::ostringstream>();
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(*out);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_pattern("%v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  return out;
}

void TestBrokerIdsUseFixedKeys() {
  auto out = CaptureDefaultLogger(spdlog::level::info);

  ROUTEBROKER_LOG_INFO("route computed", {RouteId(7), JobId("job-1"), MeshId(3), DoubleField("duration_ms", 12.5)});
  assert(out->str() == "route computed route_id=7 job_id=job-1 mesh_id=3 duration_ms=12.5\n");
}

void TestLevelFiltersLines() {
  auto out = CaptureDefaultLogger(spdlog::level::warn);

  ROUTEBROKER_LOG_INFO("dropped", {RouteId(1)});
  ROUTEBROKER_LOG_WARN("skipping mesh with unordered bounds", {StringField("md5", "eee555")});
  ROUTEBROKER_LOG_ERROR("route computation failed", {BoolField("revoked", false)});
  assert(out->str() == "skipping mesh with unordered bounds md5=eee555\nroute computation failed revoked=false\n");
}

void TestMetricsWithoutExporterAreInert() {
  auto& metrics = Metrics::Instance();
  metrics.RecordRpc("RouteService.RequestRoute", true, 1.5);
  metrics.RecordRouteRequest("dispatched");
  metrics.ObserveComputation("SUCCESS", 10.0);
  metrics.RecordRouteEvaluation(false);
  metrics.RecordMeshesImported(2);
  metrics.RecordJobsRequeued(0);
}

} // namespace

int main() {
  TestBrokerIdsUseFixedKeys();
  TestLevelFiltersLines();
  TestMetricsWithoutExporterAreInert();

  spdlog::drop_all();
  std::cout << "routebroker_unit_logging: pass\n";
  return 0;
}
