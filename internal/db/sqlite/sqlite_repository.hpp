#pragma once

#include <memory>

#include "internal/db/sql/sql_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace workledger::db::sqlite {

/*
  SQLite driver for the shared entity SQL.

  Holds one connection. Transactions on it are serialized by the write
  lock BEGIN IMMEDIATE takes, so a repository instance must not be shared
  between threads that open overlapping transactions; give each worker its
  own instance on the same file.
*/
class SqliteRepository final : public sql::SqlRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

protected:
  void Query(Transaction&, const std::string& sql, const sql::Params& params, const RowHandler& on_row) override;
  Result Execute(Transaction&, const std::string& sql, const sql::Params& params, uint64_t* affected) override;
  Result Insert(Transaction&, const std::string& sql, const sql::Params& params, const char* id_column, uint64_t* id) override;
  Result InsertBatch(Transaction&, const std::string& prefix, int arity, const std::vector<sql::Params>& rows,
                     const char* id_column, std::vector<uint64_t>* ids) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
