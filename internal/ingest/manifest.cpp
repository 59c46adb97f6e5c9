#include "manifest.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <stdexcept>

namespace routebroker::ingest {

namespace fs = std::filesystem;

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

YAML::Node Required(const YAML::Node& node, const char* key) {
  auto value = node[key];
  if (!value) {
    throw std::runtime_error(std::string("manifest record missing field: ") + key);
  }
  return value;
}

} // namespace

std::optional<std::string> FindLatestManifest(const std::string& mesh_dir) {
  std::optional<fs::path>        latest;
  std::optional<fs::file_time_type> latest_time;

  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(mesh_dir, ec)) {
    if (!entry.is_regular_file()) continue;

    const auto name = entry.path().filename().string();
    if (!StartsWith(name, kManifestPrefix) || !EndsWith(name, kManifestSuffix)) continue;

    const auto mtime = entry.last_write_time();
    if (!latest_time || mtime > *latest_time) {
      latest      = entry.path();
      latest_time = mtime;
    }
  }

  if (!latest) return std::nullopt;
  return latest->string();
}

std::vector<ManifestRecord> ParseManifest(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("failed to parse manifest: " + std::string(e.what()));
  }

  auto records = root["records"];
  if (!records || !records.IsSequence()) {
    throw std::runtime_error("manifest has no records list");
  }

  std::vector<ManifestRecord> out;
  out.reserve(records.size());
  for (const auto& node : records) {
    ManifestRecord record;
    record.filepath = Required(node, "filepath").as<std::string>();
    record.md5      = Required(node, "md5").as<std::string>();
    record.created  = util::ParseCompactUtc(Required(node, "created").as<std::string>());
    if (auto version = node["meshiphi"]) {
      record.mesh_version = version.as<std::string>();
    }

    auto latlong          = Required(node, "latlong");
    record.bounds.lat_min = Required(latlong, "latmin").as<double>();
    record.bounds.lat_max = Required(latlong, "latmax").as<double>();
    record.bounds.lon_min = Required(latlong, "lonmin").as<double>();
    record.bounds.lon_max = Required(latlong, "lonmax").as<double>();

    out.push_back(std::move(record));
  }
  return out;
}

std::string Basename(const std::string& filepath) {
  auto slash = filepath.find_last_of('/');
  return slash == std::string::npos ? filepath : filepath.substr(slash + 1);
}

bool IsMeshArtifact(const std::string& filepath) {
  return EndsWith(filepath, kMeshFileSuffix);
}

} // namespace routebroker::ingest
