#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/metadata.hpp"
#include "workledger/v1.hpp"

namespace workledger::db::model {

/*
  Persistent collection row. Unique on (transform_id, scope, name).

  The input/output/log role is not stored; an output collection carries the
  ids of its sibling input and log collections in coll_metadata.
*/

struct CollectionRecord {
  uint64_t coll_id      = 0;
  uint64_t transform_id = 0;

  std::string scope;
  std::string name;

  workledger::v1::CollectionType   coll_type = workledger::v1::COLLECTION_TYPE_DATASET;
  workledger::v1::CollectionStatus status    = workledger::v1::COLLECTION_STATUS_NEW;

  uint64_t bytes       = 0;
  uint64_t total_files = 0;
  int32_t  retries     = 0;

  std::optional<util::Metadata> coll_metadata;

  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;
  std::optional<uint64_t> expired_at_ms;
};

struct CollectionUpdate {
  std::optional<workledger::v1::CollectionType>   coll_type;
  std::optional<workledger::v1::CollectionStatus> status;
  std::optional<uint64_t>                         bytes;
  std::optional<uint64_t>                         total_files;
  std::optional<int32_t>                          retries;
  std::optional<util::Metadata>                   coll_metadata;
  std::optional<uint64_t>                         expired_at_ms;

  bool Empty() const {
    return !coll_type && !status && !bytes && !total_files && !retries && !coll_metadata && !expired_at_ms;
  }
};

} // namespace workledger::db::model
