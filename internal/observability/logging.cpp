#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef WORKLEDGER_ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace workledger::observability {
namespace {

constexpr const char* kLoggerName     = "workledger";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::atomic<bool> g_trace_context{false};

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool EnvFlagOr(const char* name, bool configured) {
  if (const char* value = std::getenv(name)) {
    const std::string flag(value);
    return flag == "1" || flag == "true";
  }
  return configured;
}

#ifdef WORKLEDGER_ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[bytes[i] >> 4]);
    out.push_back(kHex[bytes[i] & 0x0F]);
  }
}

// " trace_id=... span_id=..." for the active span, empty when there is none.
std::string TraceSuffix() {
  auto context = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent())->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_id[opentelemetry::trace::TraceId::kSize];
  uint8_t span_id[opentelemetry::trace::SpanId::kSize];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);

  std::string out = " trace_id=";
  AppendHex(out, trace_id, sizeof(trace_id));
  out += " span_id=";
  AppendHex(out, span_id, sizeof(span_id));
  return out;
}
#else
std::string TraceSuffix() {
  return {};
}
#endif

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

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

void InitializeLogging(const workledger::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  }
  logger->set_pattern(EnvOr("WORKLEDGER_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("WORKLEDGER_LOG_LEVEL", logging.level(), kDefaultLevel)));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);

  g_trace_context = EnvFlagOr("WORKLEDGER_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context());
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    line += field.value;
  }
  if (g_trace_context) {
    line += TraceSuffix();
  }
  spdlog::log(level, "{}", line);
}

} // namespace workledger::observability
