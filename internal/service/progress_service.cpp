#include "progress_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/db_status.hpp"

namespace workledger::service {

ProgressService::ProgressService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::map<workledger::v1::ContentStatus, uint64_t> ProgressService::CountByStatus(std::optional<uint64_t> coll_id) {
  return observability::ObserveOperation("ProgressService.CountByStatus", [&] {
    return util::RunReadTransaction(*ctx_.repository, "count contents by status",
                                    [&](db::Transaction& tx) { return ctx_.repository->CountContentsByStatus(tx, coll_id); });
  });
}

} // namespace workledger::service
