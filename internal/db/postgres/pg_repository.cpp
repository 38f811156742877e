#include "pg_repository.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace workledger::db::postgres {

namespace {

// Postgres caps bind parameters per statement.
constexpr std::size_t kMaxParams = 65535;

// Canonical '?' placeholders -> $1..$n. Canonical SQL has no '?' in literals.
std::string Numbered(const std::string& sql) {
  std::string out;
  out.reserve(sql.size() + 16);
  std::size_t n = 1;
  for (char c : sql) {
    if (c == '?') {
      out += '$';
      out += std::to_string(n++);
    } else {
      out += c;
    }
  }
  return out;
}

void Append(pqxx::params& out, const sql::Param& param) {
  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out.append();
        } else if constexpr (std::is_same_v<T, uint64_t>) {
          out.append(static_cast<int64_t>(v));
        } else {
          out.append(v);
        }
      },
      param);
}

pqxx::params ToParams(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    Append(out, p);
  }
  return out;
}

class PgRow final : public sql::Row {
 public:
  explicit PgRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    return row_[col].is_null() ? "" : row_[col].c_str();
  }

  int GetInt(int col) const override {
    return row_[col].as<int>();
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::data_exception*>(&e)) {
    return Result::Err(ErrorCode::InvalidArgument, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgRepository::Query(Transaction& t, const std::string& sql, const sql::Params& params, const RowHandler& on_row) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_params(Numbered(sql), ToParams(params));
  } catch (const pqxx::failure& e) {
    auto result = Translate(e);
    throw BackendError(result.code, result.message);
  }

  for (const auto& row : res) {
    PgRow view(row);
    on_row(view);
  }
}

Result PgRepository::Execute(Transaction& t, const std::string& sql, const sql::Params& params, uint64_t* affected) {
  try {
    auto res = TX(t).Work().exec_params(Numbered(sql), ToParams(params));
    if (affected) *affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

Result PgRepository::Insert(Transaction& t, const std::string& sql, const sql::Params& params, const char* id_column, uint64_t* id) {
  try {
    auto res = TX(t).Work().exec_params(Numbered(sql) + " RETURNING " + id_column, ToParams(params));
    if (id && !res.empty()) *id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

/*
  Multi-row INSERT ... RETURNING. Sequence values are handed out in row
  order, so sorting the returned ids restores input order. Batches wider
  than the bind-parameter cap are split into several statements inside the
  same transaction.
*/
Result PgRepository::InsertBatch(Transaction& t, const std::string& prefix, int arity, const std::vector<sql::Params>& rows,
                                 const char* id_column, std::vector<uint64_t>* ids) {
  if (arity <= 0) return Result::Err(ErrorCode::InvalidArgument, "batch arity must be positive");

  if (ids) {
    ids->clear();
    ids->reserve(rows.size());
  }

  const std::size_t rows_per_statement = kMaxParams / static_cast<std::size_t>(arity);
  for (std::size_t begin = 0; begin < rows.size(); begin += rows_per_statement) {
    const std::size_t end = std::min(rows.size(), begin + rows_per_statement);

    std::string  sql = prefix + " VALUES ";
    pqxx::params params;
    std::size_t  n = 1;
    for (std::size_t r = begin; r < end; ++r) {
      if (static_cast<int>(rows[r].size()) != arity) {
        return Result::Err(ErrorCode::InvalidArgument, "batch row has wrong number of parameters");
      }
      sql += r == begin ? "(" : ",(";
      for (int c = 0; c < arity; ++c) {
        if (c > 0) sql += ",";
        sql += "$" + std::to_string(n++);
        Append(params, rows[r][static_cast<std::size_t>(c)]);
      }
      sql += ")";
    }
    sql += std::string(" RETURNING ") + id_column;

    try {
      auto res = TX(t).Work().exec_params(sql, params);
      if (ids) {
        std::vector<uint64_t> chunk;
        chunk.reserve(res.size());
        for (const auto& row : res) {
          chunk.push_back(row[0].as<uint64_t>());
        }
        std::sort(chunk.begin(), chunk.end());
        ids->insert(ids->end(), chunk.begin(), chunk.end());
      }
    } catch (const pqxx::failure& e) {
      return Translate(e);
    }
  }
  return Result::Ok();
}

}
