#pragma once

#include <cstdint>
#include <string>

#include "internal/util/geo.hpp"
#include "internal/util/time.hpp"

namespace routebroker::db::model {

/*
  Persistent mesh row (metadata only).

  IMPORTANT:
  - md5 is unique across all rows; ingestion relies on it for idempotence.
  - Rows are immutable once inserted.
  - The mesh document is stored next to the row and is only loaded by id
    (Repository::GetMeshJson), never by list/filter queries.
*/

struct MeshRecord {
  int64_t id = 0;  // assigned by the repository on insert

  std::string md5;
  std::string name;

  util::TimePoint created{};

  // Producer (mesh generator) version tag.
  std::string mesh_version;

  util::BoundingBox bounds;
};

// Extent used to prefer specific meshes: bounding box area in square degrees.
inline double MeshExtent(const MeshRecord& mesh) {
  return mesh.bounds.Area();
}

} // namespace routebroker::db::model
