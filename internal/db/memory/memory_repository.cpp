#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace routebroker::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Meshes
// ------------------------------------------------------------------

Result MemoryRepository::InsertMesh(Transaction& t, model::MeshRecord& r, const std::string& json) {
  auto& s = TX(t).Mutable();
  if (s.mesh_id_by_md5.contains(r.md5)) return Result::Err(ErrorCode::Duplicate, "mesh md5 " + r.md5);

  r.id = s.next_mesh_id++;
  s.meshes[r.id]          = StoredMesh{r, std::make_shared<const std::string>(json)};
  s.mesh_id_by_md5[r.md5] = r.id;
  return Result::Ok();
}

std::optional<model::MeshRecord> MemoryRepository::GetMesh(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.meshes.find(id);
  if (it == s.meshes.end()) return std::nullopt;
  return it->second.record;
}

std::optional<model::MeshRecord> MemoryRepository::FindMeshByMd5(Transaction& t, const std::string& md5) {
  const auto& s  = TX(t).View();
  auto        it = s.mesh_id_by_md5.find(md5);
  if (it == s.mesh_id_by_md5.end()) return std::nullopt;
  return s.meshes.at(it->second).record;
}

std::optional<std::string> MemoryRepository::GetMeshJson(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.meshes.find(id);
  if (it == s.meshes.end() || !it->second.json) return std::nullopt;
  return *it->second.json;
}

std::vector<model::MeshRecord> MemoryRepository::ListMeshesContaining(Transaction& t, const util::Endpoints& endpoints) {
  std::vector<model::MeshRecord> out;
  for (const auto& [_, mesh] : TX(t).View().meshes) {
    if (mesh.record.bounds.Contains(endpoints)) out.push_back(mesh.record);
  }
  return out;
}

std::vector<model::MeshRecord> MemoryRepository::ListMeshes(Transaction& t) {
  std::vector<model::MeshRecord> out;
  for (const auto& [_, mesh] : TX(t).View().meshes) out.push_back(mesh.record);
  return out;
}

// ------------------------------------------------------------------
// Routes
// ------------------------------------------------------------------

Result MemoryRepository::InsertRoute(Transaction& t, model::RouteRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.mesh_id && !s.meshes.contains(*r.mesh_id)) {
    return Result::Err(ErrorCode::InvalidReference, "route references unknown mesh " + std::to_string(*r.mesh_id));
  }
  r.id           = s.next_route_id++;
  s.routes[r.id] = r;
  return Result::Ok();
}

std::optional<model::RouteRecord> MemoryRepository::GetRoute(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.routes.find(id);
  if (it == s.routes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRoute(Transaction& t, const model::RouteRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.routes.find(r.id);
  if (it == s.routes.end()) return Result::Err(ErrorCode::NotFound, "route " + std::to_string(r.id));
  it->second = r;
  return Result::Ok();
}

std::vector<model::RouteRecord> MemoryRepository::ListRoutesByMesh(Transaction& t, int64_t mesh_id) {
  std::vector<model::RouteRecord> out;
  for (const auto& [_, route] : TX(t).View().routes) {
    if (route.mesh_id == mesh_id) out.push_back(route);
  }
  return out;
}

std::vector<model::RouteRecord> MemoryRepository::ListRoutesRequestedBetween(Transaction& t, util::TimePoint from, util::TimePoint to) {
  std::vector<model::RouteRecord> out;
  for (const auto& [_, route] : TX(t).View().routes) {
    if (route.requested >= from && route.requested < to) out.push_back(route);
  }
  return out;
}

std::vector<model::RouteRecord> MemoryRepository::ListUnfinishedRoutes(Transaction& t) {
  std::vector<model::RouteRecord> out;
  for (const auto& [_, route] : TX(t).View().routes) {
    if (route.json.empty() && route.info.empty()) out.push_back(route);
  }
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::Duplicate, "job " + r.id);
  if (!s.routes.contains(r.route_id)) {
    return Result::Err(ErrorCode::InvalidReference, "job references unknown route " + std::to_string(r.route_id));
  }
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::JobRecord> MemoryRepository::LatestJobForRoute(Transaction& t, int64_t route_id) {
  std::optional<model::JobRecord> latest;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.route_id != route_id) continue;
    if (!latest || job.created > latest->created || (job.created == latest->created && job.id > latest->id)) {
      latest = job;
    }
  }
  return latest;
}

} // namespace routebroker::db::memory
