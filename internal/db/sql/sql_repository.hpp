#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace workledger::db::sql {

/*
  SqlRepository

  Entity SQL shared by the relational backends. A driver supplies four
  primitives and, optionally, a row-lock clause for claim selects.

  Driver contract:
    Query        rows of a SELECT; throws BackendError on failure
    Execute      UPDATE / DELETE; reports affected rows
    Insert       single-row INSERT; reports the generated id
    InsertBatch  one batched INSERT over N parameter sets; ids in input order

  All SQL handed to the driver uses '?' placeholders.
*/

class SqlRepository : public db::Repository {
 public:
  // requests
  Result InsertRequest(Transaction&, model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, uint64_t) override;
  std::optional<model::RequestRecord> GetRequestByWorkload(Transaction&, int64_t) override;
  std::vector<model::RequestRecord> ListRequests(Transaction&, const RequestFilter&) override;
  Result UpdateRequest(Transaction&, uint64_t, const model::RequestUpdate&, uint64_t now_ms,
                       std::optional<uint64_t> expected_generation) override;
  Result LockRequest(Transaction&, uint64_t, uint64_t now_ms, bool* acquired) override;
  Result ReleaseExpiredLocks(Transaction&, uint64_t locked_before_ms, uint64_t now_ms, uint64_t* released) override;
  Result DeleteRequest(Transaction&, uint64_t) override;

  // transforms
  Result InsertTransform(Transaction&, model::TransformRecord&) override;
  std::optional<model::TransformRecord> GetTransform(Transaction&, uint64_t) override;
  std::vector<model::TransformRecord> ListTransforms(Transaction&, const TransformFilter&) override;
  Result UpdateTransform(Transaction&, uint64_t, const model::TransformUpdate&, uint64_t now_ms) override;
  Result DeleteTransform(Transaction&, uint64_t) override;

  // collections
  Result InsertCollection(Transaction&, model::CollectionRecord&) override;
  std::optional<model::CollectionRecord> GetCollection(Transaction&, uint64_t) override;
  std::vector<model::CollectionRecord> ListCollections(Transaction&, const CollectionFilter&) override;
  Result UpdateCollection(Transaction&, uint64_t, const model::CollectionUpdate&, uint64_t now_ms) override;
  Result DeleteCollection(Transaction&, uint64_t) override;

  // contents
  Result InsertContents(Transaction&, const std::vector<model::ContentRecord>&, std::vector<uint64_t>* ids) override;
  std::optional<model::ContentRecord> GetContent(Transaction&, uint64_t) override;
  std::optional<model::ContentRecord> FindContent(Transaction&, uint64_t coll_id, const model::ContentIdentity&) override;
  std::vector<model::ContentRecord> MatchContents(Transaction&, uint64_t coll_id, const model::ContentIdentity&) override;
  std::vector<model::ContentRecord> ListContents(Transaction&, const ContentFilter&) override;
  Result UpdateContent(Transaction&, uint64_t, const model::ContentUpdate&, uint64_t now_ms) override;
  Result UpdateContentStatuses(Transaction&, const std::vector<ContentStatusUpdate>&, uint64_t now_ms) override;
  Result DeleteContent(Transaction&, uint64_t) override;
  std::map<workledger::v1::ContentStatus, uint64_t> CountContentsByStatus(Transaction&, std::optional<uint64_t> coll_id) override;

 protected:
  using RowHandler = std::function<void(const Row&)>;

  virtual void Query(Transaction&, const std::string& sql, const Params& params, const RowHandler& on_row) = 0;

  virtual Result Execute(Transaction&, const std::string& sql, const Params& params, uint64_t* affected) = 0;

  virtual Result Insert(Transaction&, const std::string& sql, const Params& params, const char* id_column, uint64_t* id) = 0;

  // prefix is "INSERT INTO t(c1,..,cN)"; every row carries exactly arity params.
  virtual Result InsertBatch(Transaction&, const std::string& prefix, int arity, const std::vector<Params>& rows,
                             const char* id_column, std::vector<uint64_t>* ids) = 0;

  // Appended to selects that lock the rows they return.
  virtual const char* RowLockClause() const {
    return "";
  }

 private:
  Result ExecuteOne(Transaction&, const std::string& sql, const Params& params, const char* what, uint64_t id);
};

} // namespace workledger::db::sql
