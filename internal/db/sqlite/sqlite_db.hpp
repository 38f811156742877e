#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/migrations.hpp"

namespace workledger::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  One SqliteDB per repository instance, one repository per worker thread:
  cross-worker exclusion comes from BEGIN IMMEDIATE on the shared file, not
  from sharing this handle.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  static constexpr int kDefaultBusyTimeoutMs = 5000;

  explicit SqliteDB(std::string path, int busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations). Throws BackendError.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize). Throws BackendError.
  sqlite3_stmt* Prepare(const std::string& sql);

  void ApplyStatement(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

  // Maps a sqlite result code (primary or extended) to the portable code.
  static ErrorCode Classify(int rc);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace workledger::db::sqlite
