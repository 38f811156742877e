#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/collection_record.hpp"
#include "internal/db/model/content_record.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/transform_record.hpp"

namespace workledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Writes return Result; reads throw BackendError on driver failure
  - Insert assigns the generated id into the record
  - Update stamps updated_at_ms = now_ms
  - Unique key violations surface as ConstraintViolation
  - Deleting a transform cascades to its collections, and a collection
    to its contents

  The DB is the source of truth for:
    request leases
    the transform / collection / content hierarchy
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // For statements that only read. Backends that can start a transaction
  // without taking the write lock override this.
  virtual std::unique_ptr<Transaction> BeginRead() {
    return Begin();
  }

  // ---------------------------------------------------------------------
  // Requests
  // ---------------------------------------------------------------------

  virtual Result InsertRequest(Transaction&, model::RequestRecord&) = 0;

  virtual std::optional<model::RequestRecord> GetRequest(Transaction&, uint64_t request_id) = 0;

  virtual std::optional<model::RequestRecord> GetRequestByWorkload(Transaction&, int64_t workload_id) = 0;

  // Ordered by priority desc, then request_id.
  virtual std::vector<model::RequestRecord> ListRequests(Transaction&, const RequestFilter&) = 0;

  /*
    When expected_generation is set the update only applies while the row is
    LOCKING with that lease_generation; otherwise Conflict.
  */
  virtual Result UpdateRequest(Transaction&, uint64_t request_id, const model::RequestUpdate&, uint64_t now_ms,
                               std::optional<uint64_t> expected_generation = std::nullopt) = 0;

  /*
    Conditional IDLE -> LOCKING transition. Stamps locked_at_ms and
    updated_at_ms and increments lease_generation. *acquired is false when
    the row was not IDLE any more.
  */
  virtual Result LockRequest(Transaction&, uint64_t request_id, uint64_t now_ms, bool* acquired) = 0;

  // LOCKING rows with locked_at_ms < locked_before_ms go back to IDLE.
  virtual Result ReleaseExpiredLocks(Transaction&, uint64_t locked_before_ms, uint64_t now_ms, uint64_t* released) = 0;

  virtual Result DeleteRequest(Transaction&, uint64_t request_id) = 0;

  // ---------------------------------------------------------------------
  // Transforms
  // ---------------------------------------------------------------------

  virtual Result InsertTransform(Transaction&, model::TransformRecord&) = 0;

  virtual std::optional<model::TransformRecord> GetTransform(Transaction&, uint64_t transform_id) = 0;

  virtual std::vector<model::TransformRecord> ListTransforms(Transaction&, const TransformFilter&) = 0;

  virtual Result UpdateTransform(Transaction&, uint64_t transform_id, const model::TransformUpdate&, uint64_t now_ms) = 0;

  virtual Result DeleteTransform(Transaction&, uint64_t transform_id) = 0;

  // ---------------------------------------------------------------------
  // Collections
  // ---------------------------------------------------------------------

  virtual Result InsertCollection(Transaction&, model::CollectionRecord&) = 0;

  virtual std::optional<model::CollectionRecord> GetCollection(Transaction&, uint64_t coll_id) = 0;

  virtual std::vector<model::CollectionRecord> ListCollections(Transaction&, const CollectionFilter&) = 0;

  virtual Result UpdateCollection(Transaction&, uint64_t coll_id, const model::CollectionUpdate&, uint64_t now_ms) = 0;

  virtual Result DeleteCollection(Transaction&, uint64_t coll_id) = 0;

  // ---------------------------------------------------------------------
  // Contents
  // ---------------------------------------------------------------------

  /*
    One batched insert. When ids is non-null it receives one generated id
    per record, in input order. A constraint violation fails the batch.
  */
  virtual Result InsertContents(Transaction&, const std::vector<model::ContentRecord>& batch, std::vector<uint64_t>* ids) = 0;

  virtual std::optional<model::ContentRecord> GetContent(Transaction&, uint64_t content_id) = 0;

  virtual std::optional<model::ContentRecord> FindContent(Transaction&, uint64_t coll_id, const model::ContentIdentity&) = 0;

  // Contents whose [min_id, max_id] covers the identity's range.
  virtual std::vector<model::ContentRecord> MatchContents(Transaction&, uint64_t coll_id, const model::ContentIdentity&) = 0;

  virtual std::vector<model::ContentRecord> ListContents(Transaction&, const ContentFilter&) = 0;

  virtual Result UpdateContent(Transaction&, uint64_t content_id, const model::ContentUpdate&, uint64_t now_ms) = 0;

  // Rows addressed by a ranged identity are matched on (coll_id, scope, name, min_id, max_id).
  virtual Result UpdateContentStatuses(Transaction&, const std::vector<ContentStatusUpdate>&, uint64_t now_ms) = 0;

  virtual Result DeleteContent(Transaction&, uint64_t content_id) = 0;

  virtual std::map<workledger::v1::ContentStatus, uint64_t> CountContentsByStatus(Transaction&, std::optional<uint64_t> coll_id) = 0;
};

} // namespace workledger::db
