#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/model/collection_record.hpp"
#include "service_context.hpp"

namespace workledger::service {

class CollectionService {
 public:
  explicit CollectionService(ServiceContext ctx);

  // NotFound when the owning transform does not exist.
  uint64_t AddCollection(db::model::CollectionRecord collection);

  db::model::CollectionRecord GetCollection(uint64_t coll_id);

  std::vector<db::model::CollectionRecord> ListCollections(const db::CollectionFilter& filter);

  void UpdateCollection(uint64_t coll_id, const db::model::CollectionUpdate& update);

  void DeleteCollection(uint64_t coll_id);

 private:
  ServiceContext ctx_;
};

} // namespace workledger::service
