#pragma once

#include <cstdint>
#include <map>
#include <optional>

#include "service_context.hpp"
#include "workledger/v1.hpp"

namespace workledger::service {

// Content counts grouped by status, across all collections or for one.
class ProgressService {
 public:
  explicit ProgressService(ServiceContext ctx);

  std::map<workledger::v1::ContentStatus, uint64_t> CountByStatus(std::optional<uint64_t> coll_id = std::nullopt);

 private:
  ServiceContext ctx_;
};

} // namespace workledger::service
