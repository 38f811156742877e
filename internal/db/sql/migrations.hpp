#pragma once

#include <string>
#include <vector>

namespace workledger::db::sql {

// Sink for schema statements. SqliteDB implements it directly; the postgres
// bootstrap wraps a pqxx::work.
class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ApplyStatement(const std::string& statement) = 0;
};

// Applies SqliteSchema() or PostgresSchema() in order. Every statement is
// CREATE ... IF NOT EXISTS, so reopening an existing ledger changes nothing.
// A failing step is rethrown as std::runtime_error carrying its 1-based index.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& statements);

} // namespace workledger::db::sql
