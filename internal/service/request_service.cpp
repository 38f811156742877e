#include "request_service.hpp"

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/db_status.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/metadata.hpp"

namespace workledger::service {

using namespace workledger::v1;

namespace {

constexpr std::string_view kWorkloadKey = "workload_id";

void DeriveWorkload(const std::optional<util::Metadata>& metadata, std::optional<int64_t>& workload_id) {
  if (!metadata) {
    return;
  }
  if (metadata->fields().count(std::string(kWorkloadKey)) == 0) {
    return;
  }
  auto id = util::GetInt(*metadata, kWorkloadKey);
  if (!id) {
    throw util::InvalidArgument("request metadata workload_id is not an int64 integer");
  }
  workload_id = *id;
}

} // namespace

RequestService::RequestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

uint64_t RequestService::AddRequest(db::model::RequestRecord request) {
  return observability::ObserveOperation("RequestService.AddRequest", [&] {
    if (request.scope.empty() || request.name.empty()) {
      throw util::InvalidArgument("add request: scope and name are required");
    }
    if (request.lifetime <= 0) {
      throw util::InvalidArgument("add request: lifetime must be positive, got " + std::to_string(request.lifetime));
    }

    DeriveWorkload(request.request_metadata, request.workload_id);

    const auto now           = ctx_.NowMs();
    request.request_id       = 0;
    request.locking          = REQUEST_LOCKING_IDLE;
    request.lease_generation = 0;
    request.locked_at_ms.reset();
    request.created_at_ms = now;
    request.updated_at_ms = now;
    request.expired_at_ms = util::AddMillis(now, util::DaysToMillis(static_cast<uint64_t>(request.lifetime)));

    util::RunInTransaction(*ctx_.repository, "add request", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->InsertRequest(tx, request), "add request " + request.scope + ":" + request.name);
    });
    return request.request_id;
  });
}

db::model::RequestRecord RequestService::GetRequest(uint64_t request_id) {
  return observability::ObserveOperation("RequestService.GetRequest", {observability::UintField("request_id", request_id)}, [&] {
    auto record = util::RunReadTransaction(*ctx_.repository, "get request",
                                           [&](db::Transaction& tx) { return ctx_.repository->GetRequest(tx, request_id); });
    if (!record) {
      throw util::NotFound("request " + std::to_string(request_id) + " not found");
    }
    return *record;
  });
}

db::model::RequestRecord RequestService::GetRequestByWorkload(int64_t workload_id) {
  return observability::ObserveOperation("RequestService.GetRequestByWorkload", [&] {
    auto record = util::RunReadTransaction(*ctx_.repository, "get request by workload", [&](db::Transaction& tx) {
      return ctx_.repository->GetRequestByWorkload(tx, workload_id);
    });
    if (!record) {
      throw util::NotFound("request with workload_id " + std::to_string(workload_id) + " not found");
    }
    return *record;
  });
}

std::vector<db::model::RequestRecord> RequestService::ListRequests(const db::RequestFilter& filter) {
  return observability::ObserveOperation("RequestService.ListRequests", [&] {
    return util::RunReadTransaction(*ctx_.repository, "list requests",
                                    [&](db::Transaction& tx) { return ctx_.repository->ListRequests(tx, filter); });
  });
}

void RequestService::UpdateRequest(uint64_t request_id, db::model::RequestUpdate update) {
  observability::ObserveOperation("RequestService.UpdateRequest", {observability::UintField("request_id", request_id)}, [&] {
    if (!update.workload_id) {
      DeriveWorkload(update.request_metadata, update.workload_id);
    }
    if (update.lifetime && *update.lifetime <= 0) {
      throw util::InvalidArgument("update request: lifetime must be positive");
    }

    util::RunInTransaction(*ctx_.repository, "update request", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->UpdateRequest(tx, request_id, update, ctx_.NowMs()),
                           "update request " + std::to_string(request_id));
    });
  });
}

void RequestService::ExtendRequest(uint64_t request_id, int32_t lifetime_days) {
  observability::ObserveOperation("RequestService.ExtendRequest", {observability::UintField("request_id", request_id)}, [&] {
    ExtendResolved(lifetime_days, [&](db::Transaction&) { return request_id; });
  });
}

void RequestService::ExtendRequestByWorkload(int64_t workload_id, int32_t lifetime_days) {
  observability::ObserveOperation("RequestService.ExtendRequestByWorkload", {observability::IntField("workload_id", workload_id)}, [&] {
    ExtendResolved(lifetime_days, [&](db::Transaction& tx) { return ResolveWorkload(tx, workload_id); });
  });
}

void RequestService::CancelRequest(uint64_t request_id) {
  observability::ObserveOperation("RequestService.CancelRequest", {observability::UintField("request_id", request_id)}, [&] {
    CancelResolved([&](db::Transaction&) { return request_id; });
  });
}

void RequestService::CancelRequestByWorkload(int64_t workload_id) {
  observability::ObserveOperation("RequestService.CancelRequestByWorkload", {observability::IntField("workload_id", workload_id)}, [&] {
    CancelResolved([&](db::Transaction& tx) { return ResolveWorkload(tx, workload_id); });
  });
}

uint64_t RequestService::ResolveWorkload(db::Transaction& tx, int64_t workload_id) {
  auto record = ctx_.repository->GetRequestByWorkload(tx, workload_id);
  if (!record) {
    throw util::NotFound("request with workload_id " + std::to_string(workload_id) + " not found");
  }
  return record->request_id;
}

void RequestService::ExtendResolved(int32_t lifetime_days, const Resolver& resolve) {
  if (lifetime_days <= 0) {
    throw util::InvalidArgument("extend request: lifetime must be positive, got " + std::to_string(lifetime_days));
  }

  const auto               now = ctx_.NowMs();
  db::model::RequestUpdate update;
  update.lifetime      = lifetime_days;
  update.expired_at_ms = util::AddMillis(now, util::DaysToMillis(static_cast<uint64_t>(lifetime_days)));

  util::RunInTransaction(*ctx_.repository, "extend request", [&](db::Transaction& tx) {
    const auto request_id = resolve(tx);
    util::ThrowIfDbError(ctx_.repository->UpdateRequest(tx, request_id, update, now), "extend request " + std::to_string(request_id));
  });
}

void RequestService::CancelResolved(const Resolver& resolve) {
  db::model::RequestUpdate update;
  update.status = REQUEST_STATUS_TO_CANCEL;

  uint64_t request_id = 0;
  util::RunInTransaction(*ctx_.repository, "cancel request", [&](db::Transaction& tx) {
    request_id = resolve(tx);
    util::ThrowIfDbError(ctx_.repository->UpdateRequest(tx, request_id, update, ctx_.NowMs()),
                         "cancel request " + std::to_string(request_id));
  });
  WORKLEDGER_LOG_INFO("request cancelled", {observability::UintField("request_id", request_id)});
}

void RequestService::DeleteRequest(uint64_t request_id) {
  observability::ObserveOperation("RequestService.DeleteRequest", {observability::UintField("request_id", request_id)}, [&] {
    util::RunInTransaction(*ctx_.repository, "delete request", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->DeleteRequest(tx, request_id), "delete request " + std::to_string(request_id));
    });
  });
}

} // namespace workledger::service
