#include "mesh_ingestor.hpp"

#include <filesystem>

#include "internal/db/api/db_error.hpp"
#include "internal/ingest/manifest.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/arrow_io.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace routebroker::ingest {

using namespace routebroker::observability;

MeshIngestor::MeshIngestor(std::shared_ptr<db::Repository> repository, std::string mesh_dir)
    : repository_(std::move(repository)), mesh_dir_(std::move(mesh_dir)) {
}

std::vector<ImportedMesh> MeshIngestor::ImportNewMeshes() {
  SpanScope span("mesh.import");

  auto manifest_path = FindLatestManifest(mesh_dir_);
  if (!manifest_path) {
    ROUTEBROKER_LOG_ERROR("upload metadata file not found", {StringField("mesh_dir", mesh_dir_)});
    throw util::NotFound("Upload metadata file not found in " + mesh_dir_);
  }

  span.SetAttribute("manifest", *manifest_path);
  const auto records = ParseManifest(util::ReadDocumentOrThrow(*manifest_path));

  std::vector<ImportedMesh> added;
  for (const auto& record : records) {
    if (!IsMeshArtifact(record.filepath)) {
      continue;
    }

    if (!record.bounds.IsOrdered()) {
      ROUTEBROKER_LOG_WARN("skipping mesh with unordered bounds", {StringField("md5", record.md5), StringField("filepath", record.filepath)});
      continue;
    }

    {
      auto tx     = repository_->Begin();
      auto stored = repository_->FindMeshByMd5(*tx, record.md5);
      tx->Commit();
      if (stored) {
        continue;
      }
    }

    const auto name     = Basename(record.filepath);
    const auto artifact = (std::filesystem::path(mesh_dir_) / (name + ".gz")).string();
    auto       json     = util::ReadDocumentOrThrow(artifact);

    // rejects anything that is not a JSON object
    util::ParseJsonObject(json);

    db::model::MeshRecord mesh;
    mesh.md5          = record.md5;
    mesh.name         = name;
    mesh.created      = record.created;
    mesh.mesh_version = record.mesh_version;
    mesh.bounds       = record.bounds;

    auto tx     = repository_->Begin();
    auto result = repository_->InsertMesh(*tx, mesh, json);
    if (result.code == db::ErrorCode::Duplicate) {
      continue;
    }
    db::ThrowIfDbError(result, "insert mesh");
    tx->Commit();

    ROUTEBROKER_LOG_INFO("adding new mesh", {MeshId(mesh.id), StringField("name", mesh.name),
                                             StringField("created", util::FormatUtc(mesh.created))});
    added.push_back({mesh.id, mesh.md5, mesh.name});
  }

  Metrics::Instance().RecordMeshesImported(added.size());
  span.SetAttribute("meshes_added", static_cast<std::int64_t>(added.size()));
  return added;
}

} // namespace routebroker::ingest
