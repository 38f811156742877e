#include "transform_service.hpp"

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/db_status.hpp"
#include "internal/util/errors.hpp"

namespace workledger::service {

TransformService::TransformService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

uint64_t TransformService::AddTransform(db::model::TransformRecord transform) {
  return observability::ObserveOperation("TransformService.AddTransform", [&] {
    const auto now          = ctx_.NowMs();
    transform.transform_id  = 0;
    transform.created_at_ms = now;
    transform.updated_at_ms = now;

    util::RunInTransaction(*ctx_.repository, "add transform", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->InsertTransform(tx, transform), "add transform");
    });
    return transform.transform_id;
  });
}

db::model::TransformRecord TransformService::GetTransform(uint64_t transform_id) {
  return observability::ObserveOperation("TransformService.GetTransform", [&] {
    auto record = util::RunReadTransaction(*ctx_.repository, "get transform",
                                           [&](db::Transaction& tx) { return ctx_.repository->GetTransform(tx, transform_id); });
    if (!record) {
      throw util::NotFound("transform " + std::to_string(transform_id) + " not found");
    }
    return *record;
  });
}

std::vector<db::model::TransformRecord> TransformService::ListTransforms(const db::TransformFilter& filter) {
  return observability::ObserveOperation("TransformService.ListTransforms", [&] {
    return util::RunReadTransaction(*ctx_.repository, "list transforms",
                                    [&](db::Transaction& tx) { return ctx_.repository->ListTransforms(tx, filter); });
  });
}

void TransformService::UpdateTransform(uint64_t transform_id, const db::model::TransformUpdate& update) {
  observability::ObserveOperation("TransformService.UpdateTransform", [&] {
    util::RunInTransaction(*ctx_.repository, "update transform", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->UpdateTransform(tx, transform_id, update, ctx_.NowMs()),
                           "update transform " + std::to_string(transform_id));
    });
  });
}

void TransformService::DeleteTransform(uint64_t transform_id) {
  observability::ObserveOperation("TransformService.DeleteTransform", [&] {
    util::RunInTransaction(*ctx_.repository, "delete transform", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->DeleteTransform(tx, transform_id), "delete transform " + std::to_string(transform_id));
    });
  });
}

} // namespace workledger::service
