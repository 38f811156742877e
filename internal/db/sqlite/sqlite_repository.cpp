#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <memory>
#include <type_traits>
#include <variant>

namespace workledger::db::sqlite {

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

int Bind(sqlite3_stmt* st, int idx, const sql::Param& param) {
  return std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          return sqlite3_bind_int(st, idx, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
          return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        }
      },
      param);
}

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st_, col))) : "";
  }

  int GetInt(int col) const override {
    return sqlite3_column_int(st_, col);
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kImmediate);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kDeferred);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    const auto code = SqliteDB::Classify(rc);
    if (code == ErrorCode::OK)
        return Result::Ok();
    return Result::Err(code, sqlite3_errmsg(db));
}

void SqliteRepository::Query(Transaction& t, const std::string& sql, const sql::Params& params, const RowHandler& on_row) {
    auto* db = TX(t).Handle();

    Statement st(TX(t).Db().Prepare(sql));
    for (std::size_t i = 0; i < params.size(); ++i) {
        int rc = Bind(st.get(), static_cast<int>(i + 1), params[i]);
        if (rc != SQLITE_OK)
            throw BackendError(SqliteDB::Classify(rc), sqlite3_errmsg(db));
    }

    SqliteRow row(st.get());
    for (;;) {
        int rc = sqlite3_step(st.get());
        if (rc == SQLITE_DONE)
            return;
        if (rc != SQLITE_ROW)
            throw BackendError(SqliteDB::Classify(rc), sqlite3_errmsg(db));
        on_row(row);
    }
}

Result SqliteRepository::Execute(Transaction& t, const std::string& sql, const sql::Params& params, uint64_t* affected) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    for (std::size_t i = 0; i < params.size(); ++i) {
        int rc = Bind(st.get(), static_cast<int>(i + 1), params[i]);
        if (rc != SQLITE_OK)
            return Translate(db, rc);
    }

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE)
        return Translate(db, rc);

    if (affected)
        *affected = static_cast<uint64_t>(sqlite3_changes(db));
    return Result::Ok();
}

Result SqliteRepository::Insert(Transaction& t, const std::string& sql, const sql::Params& params, const char*, uint64_t* id) {
    auto result = Execute(t, sql, params, nullptr);
    if (result && id)
        *id = static_cast<uint64_t>(sqlite3_last_insert_rowid(TX(t).Handle()));
    return result;
}

/*
  One prepared statement stepped once per row. The batch is still a single
  unit of work: the caller's transaction holds the write lock throughout,
  and the first failing row aborts the call.
*/
Result SqliteRepository::InsertBatch(Transaction& t, const std::string& prefix, int arity, const std::vector<sql::Params>& rows,
                                     const char*, std::vector<uint64_t>* ids) {
    auto* db = TX(t).Handle();

    std::string sql = prefix + " VALUES(";
    for (int i = 0; i < arity; ++i)
        sql += i == 0 ? "?" : ",?";
    sql += ")";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    if (ids) {
        ids->clear();
        ids->reserve(rows.size());
    }

    for (const auto& params : rows) {
        if (static_cast<int>(params.size()) != arity)
            return Result::Err(ErrorCode::InvalidArgument, "batch row has wrong number of parameters");

        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());
        for (int i = 0; i < arity; ++i) {
            int rc = Bind(st.get(), i + 1, params[static_cast<std::size_t>(i)]);
            if (rc != SQLITE_OK)
                return Translate(db, rc);
        }

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE)
            return Translate(db, rc);

        if (ids)
            ids->push_back(static_cast<uint64_t>(sqlite3_last_insert_rowid(db)));
    }
    return Result::Ok();
}

}
