#pragma once

#ifdef WORKLEDGER_ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <string>

namespace workledger::runtime::config {
class RuntimeConfig;
}

namespace workledger::observability {

enum class OtlpSignal { kTraces, kMetrics };

/*
  Exporter settings shared by the trace and metric pipelines.

  Endpoint precedence: observability.otlp_endpoint, then
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default for the transport.
*/
struct OtlpSettings {
  std::string               endpoint;
  bool                      http = false;
  std::chrono::milliseconds export_interval{1000};
};

OtlpSettings ResolveOtlpSettings(const workledger::runtime::config::RuntimeConfig& config, OtlpSignal signal);

// service.name, service.version and workledger.backend (memory|sqlite|postgres).
opentelemetry::sdk::resource::Resource BuildResource(const workledger::runtime::config::RuntimeConfig& config);

inline constexpr const char* kInstrumentationName    = "workledger";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

} // namespace workledger::observability

#endif
