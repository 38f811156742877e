#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/metadata.hpp"
#include "workledger/v1.hpp"

namespace workledger::db::model {

/*
  Persistent transform row.

  The owning request is not a column: it is recorded as
  transform_metadata.request_id by the commit protocol.
*/

struct TransformRecord {
  uint64_t transform_id = 0;

  workledger::v1::TransformType   transform_type = workledger::v1::TRANSFORM_TYPE_DERIVATION;
  std::string                     transform_tag;
  int32_t                         priority = 0;
  workledger::v1::TransformStatus status   = workledger::v1::TRANSFORM_STATUS_NEW;
  int32_t                         retries  = 0;

  std::optional<util::Metadata> transform_metadata;

  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;
  std::optional<uint64_t> expired_at_ms;
};

struct TransformUpdate {
  std::optional<workledger::v1::TransformType>   transform_type;
  std::optional<std::string>                     transform_tag;
  std::optional<int32_t>                         priority;
  std::optional<workledger::v1::TransformStatus> status;
  std::optional<int32_t>                         retries;
  std::optional<util::Metadata>                  transform_metadata;
  std::optional<uint64_t>                        expired_at_ms;

  bool Empty() const {
    return !transform_type && !transform_tag && !priority && !status && !retries && !transform_metadata && !expired_at_ms;
  }
};

} // namespace workledger::db::model
