#pragma once

#include "internal/db/sql/sql_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace workledger::db::postgres {

class PgRepository final : public sql::SqlRepository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

protected:
  void Query(Transaction&, const std::string& sql, const sql::Params& params, const RowHandler& on_row) override;
  Result Execute(Transaction&, const std::string& sql, const sql::Params& params, uint64_t* affected) override;
  Result Insert(Transaction&, const std::string& sql, const sql::Params& params, const char* id_column, uint64_t* id) override;
  Result InsertBatch(Transaction&, const std::string& prefix, int arity, const std::vector<sql::Params>& rows,
                     const char* id_column, std::vector<uint64_t>* ids) override;

  const char* RowLockClause() const override {
    return " FOR UPDATE SKIP LOCKED";
  }

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
