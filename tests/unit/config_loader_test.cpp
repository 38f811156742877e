#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "workledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/workledger/ledger.db"
    busy_timeout_ms: 2500
logging:
  level: debug
  include_trace_context: true
leases:
  lock_timeout_sec: 600
  sweep_interval_sec: 15
  claim_bulk_size: 20
contents:
  bulk_size: 500
observability:
  tracing_enabled: false
  otlp_endpoint: "localhost:4317"
)");

  auto config = workledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/workledger/ledger.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");
  assert(config.logging().include_trace_context());
  assert(config.leases().claim_bulk_size() == 20);
  assert(workledger::config::LockTimeoutSec(config) == 600);
  assert(workledger::config::SweepIntervalSec(config) == 15);
  assert(workledger::config::ContentBulkSize(config) == 500);
  assert(config.observability().otlp_endpoint() == "localhost:4317");
}

void TestDefaultsApplyToZeroFields() {
  auto config = workledger::config::ConfigLoader::LoadFromString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
  assert(workledger::config::LockTimeoutSec(config) == 3600);
  assert(workledger::config::SweepIntervalSec(config) == 60);
  assert(workledger::config::ContentBulkSize(config) == 100);
}

void TestEmptyDocumentGivesDefaultConfig() {
  auto config = workledger::config::ConfigLoader::LoadFromString("");
  assert(!config.has_database());
  assert(workledger::config::ContentBulkSize(config) == 100);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\ledger\\\"quoted\"\\db.sqlite"
)");

  auto config = workledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\ledger\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumericScalarStaysString() {
  auto config = workledger::config::ConfigLoader::LoadFromString(R"(database:
  postgres:
    connection_uri: "12345"
    max_connections: 4
)");
  assert(config.database().postgres().connection_uri() == "12345");
  assert(config.database().postgres().max_connections() == 4);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)workledger::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)workledger::config::ConfigLoader::LoadFromYaml("/nonexistent/workledger.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestDefaultsApplyToZeroFields();
  TestEmptyDocumentGivesDefaultConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumericScalarStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "workledger_unit_config_loader: pass\n";
  return 0;
}
