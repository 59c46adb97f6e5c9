#pragma once

#include "internal/db/model/mesh_record.hpp"
#include "internal/db/model/route_record.hpp"
#include "internal/jobs/task_registry.hpp"
#include "routebroker/v1.hpp"

namespace routebroker::service {

routebroker::v1::JobState ToProto(jobs::TaskState state);

routebroker::v1::Route ToProto(const db::model::RouteRecord& route);

routebroker::v1::MeshSummary ToSummary(const db::model::MeshRecord& mesh);

} // namespace routebroker::service
