#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/util/geo.hpp"
#include "internal/util/time.hpp"

namespace routebroker::ingest {

/*
  One artifact listed in an upload manifest.

  Manifest layout (YAML, gzip compressed):

      records:
        - filepath: some/dir/name.vessel.json
          md5: <hex digest>
          created: 20240101T120000        # UTC
          meshiphi: 2.1.0
          latlong: {latmin: .., latmax: .., lonmin: .., lonmax: ..}
*/
struct ManifestRecord {
  std::string       filepath;
  std::string       md5;
  util::TimePoint   created{};
  std::string       mesh_version;
  util::BoundingBox bounds;
};

inline constexpr const char* kManifestPrefix  = "upload_metadata_";
inline constexpr const char* kManifestSuffix  = ".yaml.gz";
inline constexpr const char* kMeshFileSuffix  = ".vessel.json";

// Most recently modified manifest in mesh_dir, nullopt when there is none.
std::optional<std::string> FindLatestManifest(const std::string& mesh_dir);

// Throws std::runtime_error on malformed YAML or missing fields.
std::vector<ManifestRecord> ParseManifest(const std::string& yaml_text);

// Final path component of a manifest filepath.
std::string Basename(const std::string& filepath);

bool IsMeshArtifact(const std::string& filepath);

} // namespace routebroker::ingest
