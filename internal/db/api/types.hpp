#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "workledger/v1.hpp"

namespace workledger::db {

/*
  Filters used by the list operations.

  Empty status vectors mean "any status". Timestamps are epoch ms.
*/

struct RequestFilter {
  std::vector<workledger::v1::RequestStatus> statuses;
  std::optional<workledger::v1::RequestType> request_type;

  // Only rows whose updated_at_ms is strictly older than this.
  std::optional<uint64_t> updated_before_ms;

  // Restrict to locking == IDLE.
  bool only_idle = false;

  // Take row locks on the selected rows (postgres: FOR UPDATE SKIP LOCKED).
  bool for_update = false;

  std::optional<std::size_t> limit;
};

struct TransformFilter {
  std::vector<workledger::v1::TransformStatus> statuses;
  std::optional<workledger::v1::TransformType> transform_type;
  std::optional<std::string>                   transform_tag;
  std::optional<uint64_t>                      updated_before_ms;
  std::optional<std::size_t>                   limit;
};

struct CollectionFilter {
  std::optional<uint64_t>                       transform_id;
  std::optional<std::string>                    scope;
  std::optional<std::string>                    name;
  std::vector<workledger::v1::CollectionStatus> statuses;
  std::optional<std::size_t>                    limit;
};

/*
  Content listing.

  scope matches exactly, name as a substring (SQL LIKE %x%); the two
  must be given together.
  Callers validate that at least one of (scope+name), coll_id, statuses is
  present.
*/
struct ContentFilter {
  std::optional<std::string>                 scope;
  std::optional<std::string>                 name;
  std::optional<uint64_t>                    coll_id;
  std::vector<workledger::v1::ContentStatus> statuses;
  std::optional<std::size_t>                 limit;
};

// One bulk status/path update. content_id wins when both addressing forms are given.
struct ContentStatusUpdate {
  std::optional<uint64_t>    content_id;
  std::optional<uint64_t>    coll_id;
  std::optional<std::string> scope;
  std::optional<std::string> name;
  std::optional<int64_t>     min_id;
  std::optional<int64_t>     max_id;

  workledger::v1::ContentStatus status = workledger::v1::CONTENT_STATUS_NEW;
  std::optional<std::string>    path;
};

} // namespace workledger::db
