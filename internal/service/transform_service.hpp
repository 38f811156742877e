#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/model/transform_record.hpp"
#include "service_context.hpp"

namespace workledger::service {

class TransformService {
 public:
  explicit TransformService(ServiceContext ctx);

  uint64_t AddTransform(db::model::TransformRecord transform);

  db::model::TransformRecord GetTransform(uint64_t transform_id);

  std::vector<db::model::TransformRecord> ListTransforms(const db::TransformFilter& filter);

  void UpdateTransform(uint64_t transform_id, const db::model::TransformUpdate& update);

  // Cascades to the transform's collections and their contents.
  void DeleteTransform(uint64_t transform_id);

 private:
  ServiceContext ctx_;
};

} // namespace workledger::service
