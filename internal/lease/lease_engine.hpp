#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/model/request_record.hpp"
#include "internal/util/time.hpp"
#include "workledger/v1.hpp"

namespace workledger::db {
class Repository;
}

namespace workledger::lease {

struct ClaimOptions {
  std::vector<workledger::v1::RequestStatus> statuses;
  std::optional<workledger::v1::RequestType> request_type;

  // Only requests last updated more than this many seconds ago.
  std::optional<uint64_t> time_period_sec;

  // Mark the selected requests LOCKING. Only IDLE requests are eligible.
  bool lock = false;

  std::optional<std::size_t> bulk_size;
};

/*
  Request leases.

  A lease is the row itself: locking == LOCKING, locked_at_ms and
  lease_generation. Claiming is a conditional IDLE -> LOCKING update inside
  the selecting transaction, so two workers can never both hold a request.
  Leases are not renewed; the sweep resets them after a flat timeout.

  Claim returns the pre-lock snapshot. The holder's fencing token is
  snapshot.lease_generation + 1.
*/
class LeaseEngine {
 public:
  explicit LeaseEngine(std::shared_ptr<db::Repository> repository, util::NowFn now = {});

  std::vector<db::model::RequestRecord> Claim(const ClaimOptions& options);

  // Resets LOCKING requests whose lease is older than time_period_sec. Returns the count.
  uint64_t ReclaimExpiredLocks(uint64_t time_period_sec);

 private:
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

// Generation a claim holder passes to the commit protocol.
inline uint64_t FencingToken(const db::model::RequestRecord& claimed) {
  return claimed.lease_generation + 1;
}

} // namespace workledger::lease
