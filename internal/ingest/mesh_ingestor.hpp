#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace routebroker::ingest {

struct ImportedMesh {
  int64_t     id = 0;
  std::string md5;
  std::string name;
};

/*
  Imports mesh artifacts announced by the newest upload manifest in
  mesh_dir.

  - Only ".vessel.json" records are considered.
  - A record whose md5 is already stored is skipped before its artifact
    is read; a duplicate inserted concurrently is skipped silently too.
  - The artifact "<mesh_dir>/<basename(filepath)>.gz" must hold a JSON
    object.

  No manifest raises util::NotFound. An unreadable artifact aborts the run
  with an exception; meshes inserted before it stay committed.
*/
class MeshIngestor {
 public:
  MeshIngestor(std::shared_ptr<db::Repository> repository, std::string mesh_dir);

  std::vector<ImportedMesh> ImportNewMeshes();

  const std::string& mesh_dir() const {
    return mesh_dir_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     mesh_dir_;
};

} // namespace routebroker::ingest
