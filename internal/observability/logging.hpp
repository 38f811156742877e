#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace workledger::runtime::config {
class RuntimeConfig;
}

namespace workledger::observability {

// Rendered as key=value after the message.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField UintField(std::string_view key, std::uint64_t value);

/*
  Installs the "workledger" stderr logger as spdlog's default. Level,
  pattern and trace-context decoration come from the logging section,
  overridden by WORKLEDGER_LOG_LEVEL, WORKLEDGER_LOG_PATTERN and
  WORKLEDGER_LOG_INCLUDE_TRACE_CONTEXT. Safe to call again.
*/
void InitializeLogging(const workledger::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields);

inline void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(level, message, std::vector<LogField>(fields));
}

} // namespace workledger::observability

#define WORKLEDGER_LOG_DEBUG(message, ...) ::workledger::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define WORKLEDGER_LOG_INFO(message, ...) ::workledger::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define WORKLEDGER_LOG_WARN(message, ...) ::workledger::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define WORKLEDGER_LOG_ERROR(message, ...) ::workledger::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
