#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"

namespace routebroker::planner { class RoutePlanner; }
namespace routebroker::jobs { class WorkerPool; }
namespace routebroker::ingest { class MeshImportScheduler; }
namespace routebroker::service {
class RouteService;
class MeshService;
} // namespace routebroker::service

namespace routebroker::factory {

/*
  Application

  Owns all long-lived objects used by the server. Background workers are
  already running when Build returns; Stop() drains and joins them.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::RouteService> route_service;
  std::shared_ptr<service::MeshService>  mesh_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<jobs::WorkerPool>           worker_pool;
  std::shared_ptr<ingest::MeshImportScheduler> import_scheduler;

  void Stop();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
  A null planner selects the built-in great circle planner.
*/
Application Build(const routebroker::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<planner::RoutePlanner> planner = nullptr);

std::shared_ptr<db::Repository> BuildRepository(const routebroker::runtime::config::RuntimeConfig& config);

}
