#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/metadata.hpp"
#include "workledger/v1.hpp"

namespace workledger::db::model {

/*
  Persistent request row.

  IMPORTANT:
  - locking == LOCKING only while exactly one worker holds the claim.
  - lease_generation increments on every successful claim; the holder's
    fencing token is (pre-claim lease_generation + 1).
  - locked_at_ms is the lease acquisition time used by the recovery sweep.
*/

struct RequestRecord {
  uint64_t request_id = 0;

  std::string scope;
  std::string name;
  std::string requester;

  workledger::v1::RequestType request_type = workledger::v1::REQUEST_TYPE_DERIVATION;
  std::string                 transform_tag;

  workledger::v1::RequestStatus  status  = workledger::v1::REQUEST_STATUS_NEW;
  workledger::v1::RequestLocking locking = workledger::v1::REQUEST_LOCKING_IDLE;

  int32_t priority = 0;

  // Lifetime in days; expired_at_ms is derived from it.
  int32_t lifetime = 30;

  std::optional<int64_t>        workload_id;
  std::optional<util::Metadata> request_metadata;
  std::optional<util::Metadata> processing_metadata;

  uint64_t lease_generation = 0;

  uint64_t                created_at_ms = 0;
  uint64_t                updated_at_ms = 0;
  std::optional<uint64_t> locked_at_ms;
  std::optional<uint64_t> expired_at_ms;
};

/*
  Partial update. Unset fields are left untouched; updated_at_ms is always
  stamped by the repository.
*/
struct RequestUpdate {
  std::optional<std::string>                    requester;
  std::optional<workledger::v1::RequestType>    request_type;
  std::optional<std::string>                    transform_tag;
  std::optional<workledger::v1::RequestStatus>  status;
  std::optional<workledger::v1::RequestLocking> locking;
  std::optional<int32_t>                        priority;
  std::optional<int32_t>                        lifetime;
  std::optional<int64_t>                        workload_id;
  std::optional<util::Metadata>                 request_metadata;
  std::optional<util::Metadata>                 processing_metadata;
  std::optional<uint64_t>                       expired_at_ms;

  bool Empty() const {
    return !requester && !request_type && !transform_tag && !status && !locking && !priority && !lifetime && !workload_id &&
           !request_metadata && !processing_metadata && !expired_at_ms;
  }
};

} // namespace workledger::db::model
