#include "migrations.hpp"

#include <stdexcept>

namespace workledger::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& statements) {
  for (std::size_t i = 0; i < statements.size(); ++i) {
    try {
      executor.ApplyStatement(statements[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration step " + std::to_string(i + 1) + " failed: " + e.what());
    }
  }
}

} // namespace workledger::db::sql
