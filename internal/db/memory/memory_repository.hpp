#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace workledger::db::memory {

class MemoryTransaction;

/*
  In-process repository for tests and single-process runs.

  Each transaction works on a private copy of the committed state and
  publishes it on commit if nobody else committed in between (otherwise
  Commit throws BackendError(SerializationFailure)). Unique keys, foreign
  keys and cascades mirror the SQL schema.
*/
class MemoryRepository : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRequest(Transaction&, model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, uint64_t) override;
  std::optional<model::RequestRecord> GetRequestByWorkload(Transaction&, int64_t) override;
  std::vector<model::RequestRecord> ListRequests(Transaction&, const RequestFilter&) override;
  Result UpdateRequest(Transaction&, uint64_t, const model::RequestUpdate&, uint64_t now_ms,
                       std::optional<uint64_t> expected_generation) override;
  Result LockRequest(Transaction&, uint64_t, uint64_t now_ms, bool* acquired) override;
  Result ReleaseExpiredLocks(Transaction&, uint64_t locked_before_ms, uint64_t now_ms, uint64_t* released) override;
  Result DeleteRequest(Transaction&, uint64_t) override;

  Result InsertTransform(Transaction&, model::TransformRecord&) override;
  std::optional<model::TransformRecord> GetTransform(Transaction&, uint64_t) override;
  std::vector<model::TransformRecord> ListTransforms(Transaction&, const TransformFilter&) override;
  Result UpdateTransform(Transaction&, uint64_t, const model::TransformUpdate&, uint64_t now_ms) override;
  Result DeleteTransform(Transaction&, uint64_t) override;

  Result InsertCollection(Transaction&, model::CollectionRecord&) override;
  std::optional<model::CollectionRecord> GetCollection(Transaction&, uint64_t) override;
  std::vector<model::CollectionRecord> ListCollections(Transaction&, const CollectionFilter&) override;
  Result UpdateCollection(Transaction&, uint64_t, const model::CollectionUpdate&, uint64_t now_ms) override;
  Result DeleteCollection(Transaction&, uint64_t) override;

  Result InsertContents(Transaction&, const std::vector<model::ContentRecord>&, std::vector<uint64_t>* ids) override;
  std::optional<model::ContentRecord> GetContent(Transaction&, uint64_t) override;
  std::optional<model::ContentRecord> FindContent(Transaction&, uint64_t coll_id, const model::ContentIdentity&) override;
  std::vector<model::ContentRecord> MatchContents(Transaction&, uint64_t coll_id, const model::ContentIdentity&) override;
  std::vector<model::ContentRecord> ListContents(Transaction&, const ContentFilter&) override;
  Result UpdateContent(Transaction&, uint64_t, const model::ContentUpdate&, uint64_t now_ms) override;
  Result UpdateContentStatuses(Transaction&, const std::vector<ContentStatusUpdate>&, uint64_t now_ms) override;
  Result DeleteContent(Transaction&, uint64_t) override;
  std::map<workledger::v1::ContentStatus, uint64_t> CountContentsByStatus(Transaction&, std::optional<uint64_t> coll_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::RequestRecord>    requests;
    std::map<uint64_t, model::TransformRecord>  transforms;
    std::map<uint64_t, model::CollectionRecord> collections;
    std::map<uint64_t, model::ContentRecord>    contents;

    uint64_t next_request_id    = 1;
    uint64_t next_transform_id  = 1;
    uint64_t next_collection_id = 1;
    uint64_t next_content_id    = 1;
  };

  static Result CheckContentUnique(const State& s, const model::ContentRecord& r);

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
