#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iterator>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/tracing.hpp"

namespace routebroker::observability {
namespace {

constexpr const char* kLoggerName     = "route-broker";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_trace_context{false};

// Environment first, then the config value, then the fallback.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.10g}", value)};
}

LogField RouteId(std::int64_t route_id) {
  return IntField("route_id", route_id);
}

LogField JobId(std::string_view job_id) {
  return StringField("job_id", job_id);
}

LogField MeshId(std::int64_t mesh_id) {
  return IntField("mesh_id", mesh_id);
}

void InitializeLogging(const routebroker::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  spdlog::drop(kLoggerName);
  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(Setting("ROUTEBROKER_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Setting("ROUTEBROKER_LOG_LEVEL", logging.level(), kDefaultLevel)));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_trace_context = logging.include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  fmt::format_to(std::back_inserter(line), "{}", message);
  for (const auto& field : fields) {
    fmt::format_to(std::back_inserter(line), " {}={}", field.key, field.value);
  }
  if (g_trace_context) {
    const auto trace = CurrentTraceContext();
    if (!trace.empty()) {
      fmt::format_to(std::back_inserter(line), " {}", trace);
    }
  }
  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace routebroker::observability
