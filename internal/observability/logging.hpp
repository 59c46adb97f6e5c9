#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace routebroker::runtime::config {
class RuntimeConfig;
}

namespace routebroker::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// Broker identifiers under fixed keys, so one route, job or mesh can be
// followed across services and workers.
LogField RouteId(std::int64_t route_id);
LogField JobId(std::string_view job_id);
LogField MeshId(std::int64_t mesh_id);

/*
  Installs the "route-broker" logger. ROUTEBROKER_LOG_LEVEL and
  ROUTEBROKER_LOG_PATTERN override logging.level and logging.pattern;
  logging.include_trace_context appends the active span's ids.
*/
void InitializeLogging(const routebroker::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace routebroker::observability

#define ROUTEBROKER_LOG_INFO(message, ...) ::routebroker::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define ROUTEBROKER_LOG_WARN(message, ...) ::routebroker::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define ROUTEBROKER_LOG_ERROR(message, ...) ::routebroker::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
