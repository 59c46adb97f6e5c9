#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace routebroker::runtime::config {
class RuntimeConfig;
}

namespace routebroker::observability {

// Installs the OTLP span exporter when observability.tracing_enabled is set.
bool InitializeTracing(const routebroker::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// "trace_id=<hex> span_id=<hex>" of the active span, or empty.
std::string CurrentTraceContext();

/*
  Active span for the lifetime of the object. Without an installed tracer
  every call is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // Marks the span failed.
  void RecordError(std::string_view message);

 private:
#ifdef ROUTEBROKER_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ROUTEBROKER_ENABLE_OTEL
inline bool InitializeTracing(const routebroker::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline std::string CurrentTraceContext() {
  return {};
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordError(std::string_view) {
}
#endif

} // namespace routebroker::observability
