#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace workledger::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  try {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection& e) {
    throw BackendError(ErrorCode::IOError, std::string("postgres begin: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    throw BackendError(ErrorCode::InternalError, std::string("postgres begin: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_ && tx_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      WORKLEDGER_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::in_doubt_error& e) {
    finished_ = true;
    throw BackendError(ErrorCode::IOError, std::string("postgres commit outcome unknown: ") + e.what());
  } catch (const pqxx::transaction_rollback& e) {
    finished_ = true;
    throw BackendError(ErrorCode::SerializationFailure, std::string("postgres commit: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    finished_ = true;
    throw BackendError(ErrorCode::IOError, std::string("postgres commit: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    finished_ = true;
    throw BackendError(ErrorCode::InternalError, std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
