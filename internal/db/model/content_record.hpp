#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "internal/util/metadata.hpp"
#include "workledger/v1.hpp"

namespace workledger::db::model {

/*
  Persistent content row.

  Identity key: (coll_id, scope, name, content_type, min_id, max_id).
  CONTENT_TYPE_FILE is the unranged case: (coll_id, scope, name) alone is
  unique among file contents.
*/

struct ContentRecord {
  uint64_t content_id = 0;
  uint64_t coll_id    = 0;

  std::string scope;
  std::string name;

  int64_t min_id = 0;
  int64_t max_id = 0;

  workledger::v1::ContentType   content_type = workledger::v1::CONTENT_TYPE_FILE;
  workledger::v1::ContentStatus status       = workledger::v1::CONTENT_STATUS_NEW;

  uint64_t    bytes = 0;
  std::string md5;
  std::string adler32;

  std::optional<int64_t> processing_id;
  std::optional<int64_t> storage_id;

  int32_t     retries = 0;
  std::string path;

  std::optional<uint64_t>       expired_at_ms;
  std::optional<util::Metadata> content_metadata;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

struct ContentUpdate {
  std::optional<workledger::v1::ContentStatus> status;
  std::optional<uint64_t>                      bytes;
  std::optional<std::string>                   md5;
  std::optional<std::string>                   adler32;
  std::optional<int64_t>                       processing_id;
  std::optional<int64_t>                       storage_id;
  std::optional<int32_t>                       retries;
  std::optional<std::string>                   path;
  std::optional<uint64_t>                      expired_at_ms;
  std::optional<util::Metadata>                content_metadata;

  bool Empty() const {
    return !status && !bytes && !md5 && !adler32 && !processing_id && !storage_id && !retries && !path && !expired_at_ms &&
           !content_metadata;
  }
};

// (scope, name) of a file content; the range does not take part.
struct UnrangedIdentity {
  std::string scope;
  std::string name;
};

// (scope, name, min_id, max_id), optionally narrowed to one content type.
struct RangedIdentity {
  std::string                                scope;
  std::string                                name;
  int64_t                                    min_id = 0;
  int64_t                                    max_id = 0;
  std::optional<workledger::v1::ContentType> content_type;
};

// Every content named (scope, name), whatever its type or range. Only
// meaningful for matching; FindContent returns the lowest content_id.
struct NamedIdentity {
  std::string scope;
  std::string name;
};

using ContentIdentity = std::variant<UnrangedIdentity, RangedIdentity, NamedIdentity>;

} // namespace workledger::db::model
