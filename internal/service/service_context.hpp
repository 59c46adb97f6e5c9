#pragma once

#include <memory>
#include <string>

namespace routebroker::core {
class MeshSelector;
class RouteMatcher;
class RouteEvaluator;
} // namespace routebroker::core
namespace routebroker::jobs { class JobLifecycleTracker; }
namespace routebroker::ingest { class MeshIngestor; }
namespace routebroker::db { class Repository; }

namespace routebroker::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<routebroker::db::Repository>         repository;
  std::shared_ptr<routebroker::core::MeshSelector>     mesh_selector;
  std::shared_ptr<routebroker::core::RouteMatcher>     route_matcher;
  std::shared_ptr<routebroker::core::RouteEvaluator>   route_evaluator;
  std::shared_ptr<routebroker::jobs::JobLifecycleTracker> job_tracker;
  std::shared_ptr<routebroker::ingest::MeshIngestor>   ingestor;

  std::string status_url_prefix = "/api/route/";
};

}
