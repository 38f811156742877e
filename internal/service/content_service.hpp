#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/model/content_record.hpp"
#include "service_context.hpp"

namespace workledger::service {

/*
  Builds the lookup identity from loose arguments.

    content_type == FILE       -> UnrangedIdentity
    otherwise (type optional)  -> RangedIdentity, min_id and max_id required

  Throws InvalidArgument when a ranged lookup lacks its range.
*/
db::model::ContentIdentity MakeContentIdentity(const std::string& scope, const std::string& name,
                                               std::optional<workledger::v1::ContentType> content_type = std::nullopt,
                                               std::optional<int64_t> min_id = std::nullopt, std::optional<int64_t> max_id = std::nullopt);

class ContentService {
 public:
  explicit ContentService(ServiceContext ctx);

  std::optional<uint64_t> AddContent(db::model::ContentRecord content, bool returning_id = true);

  /*
    Inserts in chunks of bulk_size (ServiceContext::content_bulk_size when
    unset), all inside one transaction. The result has one entry per input
    record, in input order; entries are nullopt unless returning_id.
  */
  std::vector<std::optional<uint64_t>> AddContents(std::vector<db::model::ContentRecord> contents,
                                                   std::optional<std::size_t> bulk_size = std::nullopt, bool returning_id = false);

  uint64_t GetContentId(uint64_t coll_id, const std::string& scope, const std::string& name,
                        std::optional<workledger::v1::ContentType> content_type = std::nullopt,
                        std::optional<int64_t> min_id = std::nullopt, std::optional<int64_t> max_id = std::nullopt);

  db::model::ContentRecord GetContent(uint64_t content_id);
  db::model::ContentRecord GetContent(uint64_t coll_id, const db::model::ContentIdentity& identity);

  // Contents of coll_id whose range covers [min_id, max_id]. With neither
  // content_type nor a full range, every content named scope:name. May be empty.
  std::vector<db::model::ContentRecord> MatchContents(uint64_t coll_id, const std::string& scope, const std::string& name,
                                                      std::optional<workledger::v1::ContentType> content_type = std::nullopt,
                                                      std::optional<int64_t> min_id = std::nullopt,
                                                      std::optional<int64_t> max_id = std::nullopt);

  std::vector<db::model::ContentRecord> ListContents(const db::ContentFilter& filter);

  void UpdateContent(uint64_t content_id, const db::model::ContentUpdate& update);

  // Bulk status/path update, all or nothing.
  void UpdateContents(const std::vector<db::ContentStatusUpdate>& updates);

  void DeleteContent(uint64_t content_id);

 private:
  // Validation, defaults and the chunked insert shared by AddContent(s).
  std::vector<std::optional<uint64_t>> InsertChunked(std::vector<db::model::ContentRecord> contents, std::size_t chunk,
                                                     bool returning_id);
  db::model::ContentRecord FindOrThrow(uint64_t coll_id, const db::model::ContentIdentity& identity);

  ServiceContext ctx_;
};

} // namespace workledger::service
