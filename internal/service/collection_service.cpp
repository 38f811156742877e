#include "collection_service.hpp"

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/db_status.hpp"
#include "internal/util/errors.hpp"

namespace workledger::service {

CollectionService::CollectionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

uint64_t CollectionService::AddCollection(db::model::CollectionRecord collection) {
  return observability::ObserveOperation("CollectionService.AddCollection", [&] {
    if (collection.scope.empty() || collection.name.empty()) {
      throw util::InvalidArgument("add collection: scope and name are required");
    }

    const auto now           = ctx_.NowMs();
    collection.coll_id       = 0;
    collection.created_at_ms = now;
    collection.updated_at_ms = now;

    util::RunInTransaction(*ctx_.repository, "add collection", [&](db::Transaction& tx) {
      if (!ctx_.repository->GetTransform(tx, collection.transform_id)) {
        throw util::NotFound("add collection: transform " + std::to_string(collection.transform_id) + " not found");
      }
      util::ThrowIfDbError(ctx_.repository->InsertCollection(tx, collection),
                           "add collection (transform_id=" + std::to_string(collection.transform_id) + ", scope=" + collection.scope +
                               ", name=" + collection.name + ")");
    });
    return collection.coll_id;
  });
}

db::model::CollectionRecord CollectionService::GetCollection(uint64_t coll_id) {
  return observability::ObserveOperation("CollectionService.GetCollection", [&] {
    auto record = util::RunReadTransaction(*ctx_.repository, "get collection",
                                           [&](db::Transaction& tx) { return ctx_.repository->GetCollection(tx, coll_id); });
    if (!record) {
      throw util::NotFound("collection " + std::to_string(coll_id) + " not found");
    }
    return *record;
  });
}

std::vector<db::model::CollectionRecord> CollectionService::ListCollections(const db::CollectionFilter& filter) {
  return observability::ObserveOperation("CollectionService.ListCollections", [&] {
    return util::RunReadTransaction(*ctx_.repository, "list collections",
                                    [&](db::Transaction& tx) { return ctx_.repository->ListCollections(tx, filter); });
  });
}

void CollectionService::UpdateCollection(uint64_t coll_id, const db::model::CollectionUpdate& update) {
  observability::ObserveOperation("CollectionService.UpdateCollection", [&] {
    util::RunInTransaction(*ctx_.repository, "update collection", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->UpdateCollection(tx, coll_id, update, ctx_.NowMs()),
                           "update collection " + std::to_string(coll_id));
    });
  });
}

void CollectionService::DeleteCollection(uint64_t coll_id) {
  observability::ObserveOperation("CollectionService.DeleteCollection", [&] {
    util::RunInTransaction(*ctx_.repository, "delete collection", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->DeleteCollection(tx, coll_id), "delete collection " + std::to_string(coll_id));
    });
  });
}

} // namespace workledger::service
