#include "lease_engine.hpp"

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/db_status.hpp"
#include "internal/util/errors.hpp"

namespace workledger::lease {

namespace {

uint64_t Before(uint64_t now_ms, uint64_t period_sec) {
  const auto period_ms = util::SecondsToMillis(period_sec);
  return now_ms > period_ms ? now_ms - period_ms : 0;
}

} // namespace

LeaseEngine::LeaseEngine(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

uint64_t LeaseEngine::NowMs() const {
  return util::ToUnixMillis(now_ ? now_() : util::Now());
}

std::vector<db::model::RequestRecord> LeaseEngine::Claim(const ClaimOptions& options) {
  return observability::ObserveOperation("LeaseEngine.Claim", [&] {
    if (options.statuses.empty()) {
      throw util::InvalidArgument("claim: at least one status is required");
    }
    if (options.bulk_size && *options.bulk_size == 0) {
      throw util::InvalidArgument("claim: bulk_size must be positive");
    }

    const auto        now = NowMs();
    db::RequestFilter filter;
    filter.statuses     = options.statuses;
    filter.request_type = options.request_type;
    filter.only_idle    = options.lock;
    filter.for_update   = options.lock;
    filter.limit        = options.bulk_size;
    if (options.time_period_sec) {
      filter.updated_before_ms = Before(now, *options.time_period_sec);
    }

    auto claimed = util::RunInTransaction(*repository_, "claim requests", [&](db::Transaction& tx) {
      auto candidates = repository_->ListRequests(tx, filter);
      if (!options.lock) {
        return candidates;
      }

      std::vector<db::model::RequestRecord> acquired;
      acquired.reserve(candidates.size());
      for (auto& candidate : candidates) {
        bool ok = false;
        util::ThrowIfDbError(repository_->LockRequest(tx, candidate.request_id, now, &ok),
                             "lock request " + std::to_string(candidate.request_id));
        if (ok) {
          acquired.push_back(std::move(candidate));
        }
      }
      return acquired;
    });

    if (options.lock && !claimed.empty()) {
      observability::Metrics::Instance().AddClaimedRequests(claimed.size());
      WORKLEDGER_LOG_INFO("requests claimed", {observability::UintField("count", claimed.size()),
                                               observability::UintField("first_request_id", claimed.front().request_id)});
    }
    return claimed;
  });
}

uint64_t LeaseEngine::ReclaimExpiredLocks(uint64_t time_period_sec) {
  return observability::ObserveOperation("LeaseEngine.ReclaimExpiredLocks", [&] {
    const auto now      = NowMs();
    uint64_t   released = 0;

    util::RunInTransaction(*repository_, "reclaim expired locks", [&](db::Transaction& tx) {
      util::ThrowIfDbError(repository_->ReleaseExpiredLocks(tx, Before(now, time_period_sec), now, &released), "reclaim expired locks");
    });

    if (released > 0) {
      observability::Metrics::Instance().AddReclaimedLocks(released);
      WORKLEDGER_LOG_WARN("expired request locks reclaimed", {observability::UintField("count", released),
                                                              observability::UintField("lock_timeout_sec", time_period_sec)});
    }
    return released;
  });
}

} // namespace workledger::lease
