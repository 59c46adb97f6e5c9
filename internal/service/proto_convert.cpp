#include "proto_convert.hpp"

#include "internal/util/json.hpp"

namespace routebroker::service {

using namespace routebroker::v1;

JobState ToProto(jobs::TaskState state) {
  switch (state) {
    case jobs::TaskState::kPending:
      return JOB_STATE_PENDING;
    case jobs::TaskState::kRunning:
      return JOB_STATE_RUNNING;
    case jobs::TaskState::kSuccess:
      return JOB_STATE_SUCCESS;
    case jobs::TaskState::kFailure:
      return JOB_STATE_FAILURE;
    case jobs::TaskState::kRevoked:
      return JOB_STATE_REVOKED;
  }
  return JOB_STATE_UNSPECIFIED;
}

Route ToProto(const db::model::RouteRecord& record) {
  Route route;
  route.set_id(record.id);
  *route.mutable_requested() = util::ToProto(record.requested);
  if (record.calculated) {
    *route.mutable_calculated() = util::ToProto(*record.calculated);
  }
  route.set_file(record.file);
  route.set_info(record.info);
  if (record.mesh_id) {
    route.set_mesh_id(*record.mesh_id);
  }

  route.set_start_lat(record.endpoints.start.lat);
  route.set_start_lon(record.endpoints.start.lon);
  route.set_end_lat(record.endpoints.end.lat);
  route.set_end_lon(record.endpoints.end.lon);
  route.set_start_name(record.start_name);
  route.set_end_name(record.end_name);

  if (!record.json_unsmoothed.empty()) {
    *route.mutable_json_unsmoothed() = util::ParseJsonObject(record.json_unsmoothed);
  }
  if (!record.json.empty()) {
    *route.mutable_json() = util::ParseJsonObject(record.json);
  }
  route.set_planner_version(record.planner_version);
  return route;
}

MeshSummary ToSummary(const db::model::MeshRecord& mesh) {
  MeshSummary summary;
  summary.set_id(mesh.id);
  summary.set_md5(mesh.md5);
  summary.set_name(mesh.name);
  *summary.mutable_created() = util::ToProto(mesh.created);
  summary.set_mesh_version(mesh.mesh_version);

  auto* bounds = summary.mutable_bounds();
  bounds->set_lat_min(mesh.bounds.lat_min);
  bounds->set_lat_max(mesh.bounds.lat_max);
  bounds->set_lon_min(mesh.bounds.lon_min);
  bounds->set_lon_max(mesh.bounds.lon_max);

  summary.set_size(db::model::MeshExtent(mesh));
  return summary;
}

} // namespace routebroker::service
