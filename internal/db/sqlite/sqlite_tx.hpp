#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace workledger::db::sqlite {

/*
  SQLite transaction wrapper.

  kImmediate (Begin):
    - grabs the write lock up front, so a claim's select and its lock
      updates cannot interleave with another connection's
    - a second writer waits up to busy_timeout, then Begin() throws
      BackendError(Busy)

  kDeferred (BeginRead): takes only a shared lock on first read, so
  readers do not queue behind a writer's transaction in WAL mode.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kImmediate, kDeferred };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }
  SqliteDB& Db() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_ = false;
};

}
