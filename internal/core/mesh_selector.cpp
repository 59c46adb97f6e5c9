#include "mesh_selector.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace routebroker::core {

using db::model::MeshRecord;

MeshSelector::MeshSelector(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<MeshRecord> MeshSelector::Select(const util::Endpoints& endpoints) const {
  auto tx         = repository_->Begin();
  auto containing = repository_->ListMeshesContaining(*tx, endpoints);
  tx->Commit();

  return Rank(std::move(containing));
}

std::vector<MeshRecord> MeshSelector::SelectForRoute(const std::vector<util::GeoPoint>& vertices) const {
  return Select(Envelope(vertices));
}

util::Endpoints MeshSelector::Envelope(const std::vector<util::GeoPoint>& vertices) {
  if (vertices.empty()) {
    throw util::InvalidArgument("route has no vertices");
  }

  util::Endpoints envelope{vertices.front(), vertices.front()};
  for (const auto& p : vertices) {
    envelope.start.lat = std::min(envelope.start.lat, p.lat);
    envelope.start.lon = std::min(envelope.start.lon, p.lon);
    envelope.end.lat   = std::max(envelope.end.lat, p.lat);
    envelope.end.lon   = std::max(envelope.end.lon, p.lon);
  }
  return envelope;
}

std::vector<MeshRecord> MeshSelector::Rank(std::vector<MeshRecord> containing) {
  if (containing.empty()) {
    return containing;
  }

  int64_t latest_day = util::UtcDayNumber(containing.front().created);
  for (const auto& mesh : containing) {
    latest_day = std::max(latest_day, util::UtcDayNumber(mesh.created));
  }

  std::vector<MeshRecord> out;
  for (auto& mesh : containing) {
    if (util::UtcDayNumber(mesh.created) == latest_day) {
      out.push_back(std::move(mesh));
    }
  }

  std::sort(out.begin(), out.end(), [](const MeshRecord& a, const MeshRecord& b) {
    const double extent_a = db::model::MeshExtent(a);
    const double extent_b = db::model::MeshExtent(b);
    if (extent_a != extent_b) return extent_a < extent_b;
    return a.id < b.id;
  });
  return out;
}

} // namespace routebroker::core
