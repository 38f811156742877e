#include "transform_committer.hpp"

#include <cstddef>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/db_status.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/metadata.hpp"

namespace workledger::core {

namespace {

void Validate(const std::vector<TransformToAdd>& transforms) {
  for (std::size_t i = 0; i < transforms.size(); ++i) {
    const auto& collections = transforms[i].collections;
    if (!collections || collections->Empty()) {
      throw util::InvalidArgument("commit transforms: transform #" + std::to_string(i) +
                                  " must have collections (input, output or log)");
    }
    const auto& metadata = transforms[i].transform.transform_metadata;
    if (metadata && metadata->fields().count("workload_id") && !util::GetInt(*metadata, "workload_id")) {
      throw util::InvalidArgument("commit transforms: transform #" + std::to_string(i) + " has a non-integer workload_id");
    }
    for (const auto* role : {&collections->input_collections, &collections->output_collections, &collections->log_collections}) {
      for (const auto& collection : *role) {
        if (collection.scope.empty() || collection.name.empty()) {
          throw util::InvalidArgument("commit transforms: transform #" + std::to_string(i) + " has a collection without scope/name");
        }
      }
    }
  }
}

std::vector<uint64_t> InsertCollections(db::Repository& repository, db::Transaction& tx, std::vector<db::model::CollectionRecord>& collections,
                                        uint64_t transform_id, uint64_t now) {
  std::vector<uint64_t> ids;
  ids.reserve(collections.size());
  for (auto& collection : collections) {
    collection.coll_id       = 0;
    collection.transform_id  = transform_id;
    collection.created_at_ms = now;
    collection.updated_at_ms = now;
    util::ThrowIfDbError(repository.InsertCollection(tx, collection), "insert collection " + collection.scope + ":" + collection.name +
                                                                          " for transform " + std::to_string(transform_id));
    ids.push_back(collection.coll_id);
  }
  return ids;
}

} // namespace

TransformCommitter::TransformCommitter(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

std::vector<CommittedTransform> TransformCommitter::CommitTransforms(uint64_t request_id, db::model::RequestUpdate request_update,
                                                                     std::vector<TransformToAdd>            transforms_to_add,
                                                                     const std::vector<TransformExtension>& transforms_to_extend,
                                                                     std::optional<uint64_t>                lease_generation) {
  return observability::ObserveOperation("TransformCommitter.CommitTransforms", {observability::UintField("request_id", request_id)}, [&] {
    Validate(transforms_to_add);

    if (lease_generation && !request_update.locking) {
      request_update.locking = workledger::v1::REQUEST_LOCKING_IDLE;
    }

    const auto now = util::ToUnixMillis(now_ ? now_() : util::Now());

    auto committed = util::RunInTransaction(*repository_, "commit transforms", [&](db::Transaction& tx) {
      std::vector<CommittedTransform> out;
      out.reserve(transforms_to_add.size());

      for (auto& item : transforms_to_add) {
        auto& transform = item.transform;
        auto& roles     = *item.collections;

        if (!transform.transform_metadata) {
          transform.transform_metadata.emplace();
        }
        util::SetInt(*transform.transform_metadata, "request_id", static_cast<int64_t>(request_id));
        transform.transform_id  = 0;
        transform.created_at_ms = now;
        transform.updated_at_ms = now;
        util::ThrowIfDbError(repository_->InsertTransform(tx, transform), "insert transform for request " + std::to_string(request_id));

        CommittedTransform result;
        result.transform_id   = transform.transform_id;
        result.input_coll_ids = InsertCollections(*repository_, tx, roles.input_collections, transform.transform_id, now);
        result.log_coll_ids   = InsertCollections(*repository_, tx, roles.log_collections, transform.transform_id, now);

        const auto workload_id = util::GetInt(*transform.transform_metadata, "workload_id");
        for (auto& output : roles.output_collections) {
          auto& metadata = output.coll_metadata ? *output.coll_metadata : output.coll_metadata.emplace();
          util::SetInt(metadata, "transform_id", static_cast<int64_t>(transform.transform_id));
          if (workload_id) {
            util::SetInt(metadata, "workload_id", *workload_id);
          }
          util::SetIntList(metadata, "input_collections", result.input_coll_ids);
          util::SetIntList(metadata, "log_collections", result.log_coll_ids);
        }
        result.output_coll_ids = InsertCollections(*repository_, tx, roles.output_collections, transform.transform_id, now);

        out.push_back(std::move(result));
      }

      for (const auto& extension : transforms_to_extend) {
        util::ThrowIfDbError(repository_->UpdateTransform(tx, extension.transform_id, extension.update, now),
                             "extend transform " + std::to_string(extension.transform_id));
      }

      util::ThrowIfDbError(repository_->UpdateRequest(tx, request_id, request_update, now, lease_generation),
                           "update request " + std::to_string(request_id));
      return out;
    });

    WORKLEDGER_LOG_INFO("transforms committed", {observability::UintField("request_id", request_id),
                                                 observability::UintField("added", committed.size()),
                                                 observability::UintField("extended", transforms_to_extend.size()),
                                                 observability::BoolField("fenced", lease_generation.has_value())});
    return committed;
  });
}

} // namespace workledger::core
