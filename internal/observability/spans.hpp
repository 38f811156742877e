#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace workledger::runtime::config {
class RuntimeConfig;
}

namespace workledger::observability {

// Both return false (and leave the no-op provider in place) when the
// signal is disabled in config or the build has no OpenTelemetry.
bool InitializeTracing(const workledger::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const workledger::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the lifetime of the object.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void RecordException(std::string_view description);

 private:
#ifdef WORKLEDGER_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

    workledger.operation.count       {operation, success}
    workledger.operation.latency_ms  {operation}
    workledger.lease.claimed         requests moved IDLE -> LOCKING
    workledger.lease.reclaimed       expired leases reset by the sweep
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view operation, bool success);
  void ObserveOperationLatencyMs(std::string_view operation, double latency_ms);
  void AddClaimedRequests(std::uint64_t count);
  void AddReclaimedLocks(std::uint64_t count);

 private:
  Metrics();
#ifdef WORKLEDGER_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef WORKLEDGER_ENABLE_OTEL
inline bool InitializeTracing(const workledger::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const workledger::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, bool) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::AddClaimedRequests(std::uint64_t) {
}

inline void Metrics::AddReclaimedLocks(std::uint64_t) {
}
#endif

} // namespace workledger::observability
