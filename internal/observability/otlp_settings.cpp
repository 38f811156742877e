#include "internal/observability/otlp_settings.hpp"

#ifdef WORKLEDGER_ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace workledger::observability {

namespace {

const char* BackendName(const workledger::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) return "sqlite";
  if (database.has_postgres()) return "postgres";
  return "memory";
}

} // namespace

OtlpSettings ResolveOtlpSettings(const workledger::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.http = observability.transport() == workledger::runtime::config::OTLP_TRANSPORT_HTTP;
  if (observability.metrics_interval_ms() > 0) {
    settings.export_interval = std::chrono::milliseconds(observability.metrics_interval_ms());
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env)) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else if (settings.http) {
    settings.endpoint = signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    settings.endpoint = "localhost:4317";
  }
  return settings;
}

opentelemetry::sdk::resource::Resource BuildResource(const workledger::runtime::config::RuntimeConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attributes = {
      {"service.name", std::string(kInstrumentationName)},
      {"service.version", std::string(kInstrumentationVersion)},
      {"workledger.backend", std::string(BackendName(config.database()))},
  };
  return opentelemetry::sdk::resource::Resource::Create(attributes);
}

} // namespace workledger::observability

#endif
