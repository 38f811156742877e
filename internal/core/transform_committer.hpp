#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/model/collection_record.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/transform_record.hpp"
#include "internal/util/time.hpp"

namespace workledger::db {
class Repository;
}

namespace workledger::core {

struct CollectionSet {
  std::vector<db::model::CollectionRecord> input_collections;
  std::vector<db::model::CollectionRecord> output_collections;
  std::vector<db::model::CollectionRecord> log_collections;

  bool Empty() const {
    return input_collections.empty() && output_collections.empty() && log_collections.empty();
  }
};

struct TransformToAdd {
  db::model::TransformRecord   transform;
  std::optional<CollectionSet> collections;
};

struct TransformExtension {
  uint64_t                   transform_id = 0;
  db::model::TransformUpdate update;
};

struct CommittedTransform {
  uint64_t              transform_id = 0;
  std::vector<uint64_t> input_coll_ids;
  std::vector<uint64_t> output_coll_ids;
  std::vector<uint64_t> log_coll_ids;
};

/*
  Hierarchical commit.

  In ONE transaction:
    1. every transform to add, with its input, log and output collections
       (output coll_metadata gets transform_id, workload_id,
       input_collections and log_collections)
    2. every extension, as a transform update
    3. the request update

  Nothing is written when any step fails.

  With lease_generation set the request update is fenced: it only applies
  while the request is still LOCKING under that generation (LeaseConflict
  otherwise), and the lease is released unless the update sets locking
  itself.
*/
class TransformCommitter {
 public:
  explicit TransformCommitter(std::shared_ptr<db::Repository> repository, util::NowFn now = {});

  std::vector<CommittedTransform> CommitTransforms(uint64_t request_id, db::model::RequestUpdate request_update,
                                                   std::vector<TransformToAdd>            transforms_to_add,
                                                   const std::vector<TransformExtension>& transforms_to_extend,
                                                   std::optional<uint64_t>                lease_generation = std::nullopt);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace workledger::core
