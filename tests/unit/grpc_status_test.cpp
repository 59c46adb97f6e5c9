#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/core/mesh_selector.hpp"
#include "internal/core/route_matcher.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/mesh_admin_server.hpp"
#include "internal/grpc/route_server.hpp"
#include "internal/jobs/job_tracker.hpp"
#include "internal/jobs/task_queue.hpp"
#include "internal/jobs/task_registry.hpp"
#include "internal/service/mesh_service.hpp"
#include "internal/service/route_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "routebroker/v1.hpp"

namespace {

routebroker::service::ServiceContext BuildServiceContext() {
  auto repository = std::make_shared<routebroker::db::memory::MemoryRepository>();

  routebroker::service::ServiceContext ctx;
  ctx.repository    = repository;
  ctx.mesh_selector = std::make_shared<routebroker::core::MeshSelector>(repository);
  ctx.route_matcher = std::make_shared<routebroker::core::RouteMatcher>(repository, 1.0);
  ctx.job_tracker   = std::make_shared<routebroker::jobs::JobLifecycleTracker>(repository, std::make_shared<routebroker::jobs::TaskQueue>(),
                                                                             std::make_shared<routebroker::jobs::TaskRegistry>(), "");
  return ctx;
}

void TestExceptionMapping() {
  using routebroker::grpc::ToStatus;

  assert(ToStatus(routebroker::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(routebroker::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(routebroker::util::InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(routebroker::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

// Repository results reach the wire through ThrowIfDbError and ToStatus.
::grpc::StatusCode StatusFor(routebroker::db::ErrorCode code) {
  try {
    routebroker::db::ThrowIfDbError(routebroker::db::Result::Err(code, "detail"), "insert job");
  } catch (const std::exception& e) {
    return routebroker::grpc::ToStatus(e).error_code();
  }
  return ::grpc::StatusCode::OK;
}

void TestRepositoryErrorMapping() {
  using routebroker::db::ErrorCode;

  assert(StatusFor(ErrorCode::Ok) == ::grpc::StatusCode::OK);
  assert(StatusFor(ErrorCode::Duplicate) == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(StatusFor(ErrorCode::NotFound) == ::grpc::StatusCode::NOT_FOUND);
  assert(StatusFor(ErrorCode::InvalidReference) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(StatusFor(ErrorCode::Contention) == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(StatusFor(ErrorCode::Unavailable) == ::grpc::StatusCode::INTERNAL);
  assert(StatusFor(ErrorCode::Storage) == ::grpc::StatusCode::INTERNAL);

  bool threw = false;
  try {
    routebroker::db::ThrowIfDbError(routebroker::db::Result::Err(ErrorCode::Contention, "database is locked"), "update route");
  } catch (const routebroker::util::InvalidState& e) {
    threw = true;
    assert(std::string(e.what()) == "update route: contention: database is locked");
  }
  assert(threw);
}

void TestEvaluateWithoutEvaluatorReturnsFailedPrecondition() {
  auto                          route_service = std::make_shared<routebroker::service::RouteService>(BuildServiceContext());
  routebroker::grpc::RouteServer server(route_service);

  routebroker::services::v1::EvaluateRouteRequest  req;
  routebroker::services::v1::EvaluateRouteResponse resp;
  ::grpc::ServerContext                            grpc_ctx;

  const auto status = server.EvaluateRoute(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestUnknownJobReturnsNotFound() {
  auto                          route_service = std::make_shared<routebroker::service::RouteService>(BuildServiceContext());
  routebroker::grpc::RouteServer server(route_service);

  routebroker::services::v1::GetRouteStatusRequest req;
  req.set_id("missing-job");
  routebroker::v1::RouteStatus resp;
  ::grpc::ServerContext         grpc_ctx;

  const auto status = server.GetRouteStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestOutOfRangeCoordinateReturnsInvalidArgument() {
  auto                          route_service = std::make_shared<routebroker::service::RouteService>(BuildServiceContext());
  routebroker::grpc::RouteServer server(route_service);

  routebroker::services::v1::RequestRouteRequest req;
  req.set_start_lat(-65.0);
  req.set_start_lon(200.0);
  req.set_end_lat(-61.0);
  req.set_end_lon(-61.0);
  routebroker::services::v1::RequestRouteResponse resp;
  ::grpc::ServerContext                           grpc_ctx;

  const auto status = server.RequestRoute(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestNoMeshIsAnOrdinaryResponse() {
  auto                          route_service = std::make_shared<routebroker::service::RouteService>(BuildServiceContext());
  routebroker::grpc::RouteServer server(route_service);

  routebroker::services::v1::RequestRouteRequest req;
  req.set_start_lat(-65.0);
  req.set_start_lon(-65.0);
  req.set_end_lat(-61.0);
  req.set_end_lon(-61.0);
  routebroker::services::v1::RequestRouteResponse resp;
  ::grpc::ServerContext                           grpc_ctx;

  const auto status = server.RequestRoute(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.status() == routebroker::v1::JOB_STATE_FAILURE);
}

void TestImportWithoutMeshDirReturnsFailedPrecondition() {
  auto                              mesh_service = std::make_shared<routebroker::service::MeshService>(BuildServiceContext());
  routebroker::grpc::MeshAdminServer server(mesh_service);

  routebroker::services::v1::ImportMeshesRequest  req;
  routebroker::services::v1::ImportMeshesResponse resp;
  ::grpc::ServerContext                           grpc_ctx;

  const auto status = server.ImportMeshes(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestRepositoryErrorMapping();
  TestEvaluateWithoutEvaluatorReturnsFailedPrecondition();
  TestUnknownJobReturnsNotFound();
  TestOutOfRangeCoordinateReturnsInvalidArgument();
  TestNoMeshIsAnOrdinaryResponse();
  TestImportWithoutMeshDirReturnsFailedPrecondition();

  std::cout << "routebroker_unit_grpc_status: pass\n";
  return 0;
}
