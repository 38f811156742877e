#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/request_record.hpp"
#include "service_context.hpp"

namespace workledger::service {

class RequestService {
 public:
  explicit RequestService(ServiceContext ctx);

  // Applies defaults, derives workload_id and expired_at_ms; returns the new id.
  uint64_t AddRequest(db::model::RequestRecord request);

  db::model::RequestRecord GetRequest(uint64_t request_id);
  db::model::RequestRecord GetRequestByWorkload(int64_t workload_id);

  std::vector<db::model::RequestRecord> ListRequests(const db::RequestFilter& filter);

  void UpdateRequest(uint64_t request_id, db::model::RequestUpdate update);

  // New lifetime in days, counted from now.
  void ExtendRequest(uint64_t request_id, int32_t lifetime_days);
  void ExtendRequestByWorkload(int64_t workload_id, int32_t lifetime_days);

  void CancelRequest(uint64_t request_id);
  void CancelRequestByWorkload(int64_t workload_id);

  void DeleteRequest(uint64_t request_id);

 private:
  // Maps to the target request id inside the operation's transaction.
  using Resolver = std::function<uint64_t(db::Transaction&)>;

  uint64_t ResolveWorkload(db::Transaction& tx, int64_t workload_id);
  void     ExtendResolved(int32_t lifetime_days, const Resolver& resolve);
  void     CancelResolved(const Resolver& resolve);

  ServiceContext ctx_;
};

} // namespace workledger::service
