#include "sql_repository.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/metadata.hpp"

namespace workledger::db::sql {

using namespace workledger::v1;

namespace {

// ------------------------------------------------------------------
// Encoding helpers
// ------------------------------------------------------------------

template <typename Enum>
Param EnumParam(Enum value) {
  return static_cast<int32_t>(value);
}

Param MetadataParam(const std::optional<util::Metadata>& metadata) {
  if (!metadata) return nullptr;
  return util::EncodeMetadata(*metadata);
}

template <typename Enum>
Enum CheckedEnum(int value, bool (*is_valid)(int), const char* what) {
  if (!is_valid(value)) {
    throw BackendError(ErrorCode::Corruption, std::string("invalid ") + what + " value " + std::to_string(value));
  }
  return static_cast<Enum>(value);
}

std::optional<util::Metadata> ReadMetadata(const Row& row, int col) {
  if (row.IsNull(col)) return std::nullopt;
  try {
    return util::DecodeMetadata(row.GetText(col));
  } catch (const std::exception& e) {
    throw BackendError(ErrorCode::Corruption, std::string("stored metadata is not valid JSON: ") + e.what());
  }
}

/*
  Builds "a=?,b=?" and the matching params for partial updates.
*/
class Assignments {
 public:
  void Add(const char* column, Param value) {
    Raw(std::string(column) + "=?");
    params_.push_back(std::move(value));
  }

  void Raw(const std::string& fragment) {
    if (!sql_.empty()) sql_ += ",";
    sql_ += fragment;
  }

  template <typename T>
  void Set(const char* column, const std::optional<T>& value) {
    if (!value) return;
    if constexpr (std::is_enum_v<T>) {
      Add(column, EnumParam(*value));
    } else {
      Add(column, Param(*value));
    }
  }

  void SetMetadata(const char* column, const std::optional<util::Metadata>& value) {
    if (value) Add(column, MetadataParam(value));
  }

  const std::string& Sql() const {
    return sql_;
  }
  Params& MutableParams() {
    return params_;
  }

 private:
  std::string sql_;
  Params      params_;
};

/*
  Builds " WHERE a=? AND b IN (?,?)".
*/
class Conditions {
 public:
  void Add(const std::string& fragment) {
    sql_ += sql_.empty() ? " WHERE " : " AND ";
    sql_ += fragment;
  }

  void Add(const std::string& fragment, Param value) {
    Add(fragment);
    params_.push_back(std::move(value));
  }

  template <typename Enum>
  void In(const char* column, const std::vector<Enum>& values) {
    if (values.empty()) return;
    std::string fragment = std::string(column) + " IN (";
    for (std::size_t i = 0; i < values.size(); ++i) {
      fragment += i == 0 ? "?" : ",?";
      params_.push_back(EnumParam(values[i]));
    }
    fragment += ")";
    Add(fragment);
  }

  void Limit(const std::optional<std::size_t>& limit) {
    if (!limit) return;
    tail_ += " LIMIT ?";
    params_.push_back(static_cast<int64_t>(*limit));
  }

  void OrderBy(const char* order) {
    tail_ += std::string(" ORDER BY ") + order;
  }

  std::string Sql() const {
    return sql_ + tail_;
  }
  const Params& GetParams() const {
    return params_;
  }

 private:
  std::string sql_;
  std::string tail_;
  Params      params_;
};

std::string Select(const char* columns, const char* table) {
  return std::string("SELECT ") + columns + " FROM " + table;
}

// ------------------------------------------------------------------
// Row readers (column order from sql_queries.hpp)
// ------------------------------------------------------------------

model::RequestRecord ReadRequest(const Row& row) {
  model::RequestRecord r;
  r.request_id          = row.GetU64(0);
  r.scope               = row.GetText(1);
  r.name                = row.GetText(2);
  r.requester           = row.GetText(3);
  r.request_type        = CheckedEnum<RequestType>(row.GetInt(4), RequestType_IsValid, "request_type");
  r.transform_tag       = row.GetText(5);
  r.status              = CheckedEnum<RequestStatus>(row.GetInt(6), RequestStatus_IsValid, "request status");
  r.locking             = CheckedEnum<RequestLocking>(row.GetInt(7), RequestLocking_IsValid, "request locking");
  r.priority            = row.GetInt(8);
  r.lifetime            = row.GetInt(9);
  r.workload_id         = row.GetOptionalInt64(10);
  r.request_metadata    = ReadMetadata(row, 11);
  r.processing_metadata = ReadMetadata(row, 12);
  r.lease_generation    = row.GetU64(13);
  r.created_at_ms       = row.GetU64(14);
  r.updated_at_ms       = row.GetU64(15);
  r.locked_at_ms        = row.GetOptionalU64(16);
  r.expired_at_ms       = row.GetOptionalU64(17);
  return r;
}

model::TransformRecord ReadTransform(const Row& row) {
  model::TransformRecord r;
  r.transform_id       = row.GetU64(0);
  r.transform_type     = CheckedEnum<TransformType>(row.GetInt(1), TransformType_IsValid, "transform_type");
  r.transform_tag      = row.GetText(2);
  r.priority           = row.GetInt(3);
  r.status             = CheckedEnum<TransformStatus>(row.GetInt(4), TransformStatus_IsValid, "transform status");
  r.retries            = row.GetInt(5);
  r.transform_metadata = ReadMetadata(row, 6);
  r.created_at_ms      = row.GetU64(7);
  r.updated_at_ms      = row.GetU64(8);
  r.expired_at_ms      = row.GetOptionalU64(9);
  return r;
}

model::CollectionRecord ReadCollection(const Row& row) {
  model::CollectionRecord r;
  r.coll_id       = row.GetU64(0);
  r.transform_id  = row.GetU64(1);
  r.scope         = row.GetText(2);
  r.name          = row.GetText(3);
  r.coll_type     = CheckedEnum<CollectionType>(row.GetInt(4), CollectionType_IsValid, "coll_type");
  r.status        = CheckedEnum<CollectionStatus>(row.GetInt(5), CollectionStatus_IsValid, "collection status");
  r.bytes         = row.GetU64(6);
  r.total_files   = row.GetU64(7);
  r.retries       = row.GetInt(8);
  r.coll_metadata = ReadMetadata(row, 9);
  r.created_at_ms = row.GetU64(10);
  r.updated_at_ms = row.GetU64(11);
  r.expired_at_ms = row.GetOptionalU64(12);
  return r;
}

model::ContentRecord ReadContent(const Row& row) {
  model::ContentRecord r;
  r.content_id       = row.GetU64(0);
  r.coll_id          = row.GetU64(1);
  r.scope            = row.GetText(2);
  r.name             = row.GetText(3);
  r.min_id           = row.GetInt64(4);
  r.max_id           = row.GetInt64(5);
  r.content_type     = CheckedEnum<ContentType>(row.GetInt(6), ContentType_IsValid, "content_type");
  r.status           = CheckedEnum<ContentStatus>(row.GetInt(7), ContentStatus_IsValid, "content status");
  r.bytes            = row.GetU64(8);
  r.md5              = row.GetText(9);
  r.adler32          = row.GetText(10);
  r.processing_id    = row.GetOptionalInt64(11);
  r.storage_id       = row.GetOptionalInt64(12);
  r.retries          = row.GetInt(13);
  r.path             = row.GetText(14);
  r.expired_at_ms    = row.GetOptionalU64(15);
  r.content_metadata = ReadMetadata(row, 16);
  r.created_at_ms    = row.GetU64(17);
  r.updated_at_ms    = row.GetU64(18);
  return r;
}

Params ContentParams(const model::ContentRecord& r) {
  return {r.coll_id,
          r.scope,
          r.name,
          r.min_id,
          r.max_id,
          EnumParam(r.content_type),
          EnumParam(r.status),
          r.bytes,
          r.md5,
          r.adler32,
          OptionalParam(r.processing_id),
          OptionalParam(r.storage_id),
          r.retries,
          r.path,
          OptionalParam(r.expired_at_ms),
          MetadataParam(r.content_metadata),
          r.created_at_ms,
          r.updated_at_ms};
}

/*
  Identity predicates.

  Unranged: file contents keyed on (coll_id, scope, name).
  Ranged, exact:    min_id = ? AND max_id = ?
  Ranged, covering: min_id <= ? AND max_id >= ?
  Named:            scope and name only
*/
Conditions IdentityConditions(uint64_t coll_id, const model::ContentIdentity& identity, bool covering) {
  Conditions where;
  where.Add("coll_id=?", coll_id);
  std::visit(
      [&](const auto& id) {
        using T = std::decay_t<decltype(id)>;
        where.Add("scope=?", id.scope);
        where.Add("name=?", id.name);
        if constexpr (std::is_same_v<T, model::UnrangedIdentity>) {
          where.Add("content_type=?", EnumParam(CONTENT_TYPE_FILE));
        } else if constexpr (std::is_same_v<T, model::RangedIdentity>) {
          if (id.content_type) where.Add("content_type=?", EnumParam(*id.content_type));
          where.Add(covering ? "min_id<=?" : "min_id=?", id.min_id);
          where.Add(covering ? "max_id>=?" : "max_id=?", id.max_id);
        }
      },
      identity);
  where.OrderBy("content_id ASC");
  return where;
}

} // namespace

Result SqlRepository::ExecuteOne(Transaction& t, const std::string& sql, const Params& params, const char* what, uint64_t id) {
  uint64_t affected = 0;
  auto     result   = Execute(t, sql, params, &affected);
  if (!result) return result;
  if (affected == 0) return Result::Err(ErrorCode::NotFound, std::string(what) + " " + std::to_string(id) + " not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result SqlRepository::InsertRequest(Transaction& t, model::RequestRecord& r) {
  Params params = {r.scope,
                   r.name,
                   r.requester,
                   EnumParam(r.request_type),
                   r.transform_tag,
                   EnumParam(r.status),
                   EnumParam(r.locking),
                   r.priority,
                   r.lifetime,
                   OptionalParam(r.workload_id),
                   MetadataParam(r.request_metadata),
                   MetadataParam(r.processing_metadata),
                   r.lease_generation,
                   r.created_at_ms,
                   r.updated_at_ms,
                   OptionalParam(r.locked_at_ms),
                   OptionalParam(r.expired_at_ms)};
  return Insert(t, INSERT_REQUEST, params, "request_id", &r.request_id);
}

std::optional<model::RequestRecord> SqlRepository::GetRequest(Transaction& t, uint64_t request_id) {
  std::optional<model::RequestRecord> out;
  Query(t, Select(REQUEST_COLUMNS, "requests") + " WHERE request_id=?", {request_id},
        [&](const Row& row) { out = ReadRequest(row); });
  return out;
}

std::optional<model::RequestRecord> SqlRepository::GetRequestByWorkload(Transaction& t, int64_t workload_id) {
  std::optional<model::RequestRecord> out;
  Query(t, Select(REQUEST_COLUMNS, "requests") + " WHERE workload_id=? ORDER BY request_id ASC LIMIT 1", {workload_id},
        [&](const Row& row) { out = ReadRequest(row); });
  return out;
}

std::vector<model::RequestRecord> SqlRepository::ListRequests(Transaction& t, const RequestFilter& filter) {
  Conditions where;
  where.In("status", filter.statuses);
  if (filter.request_type) where.Add("request_type=?", EnumParam(*filter.request_type));
  if (filter.updated_before_ms) where.Add("updated_at_ms<?", *filter.updated_before_ms);
  if (filter.only_idle) where.Add("locking=?", EnumParam(REQUEST_LOCKING_IDLE));
  where.OrderBy("priority DESC, request_id ASC");
  where.Limit(filter.limit);

  std::string sql = Select(REQUEST_COLUMNS, "requests") + where.Sql();
  if (filter.for_update) sql += RowLockClause();

  std::vector<model::RequestRecord> out;
  Query(t, sql, where.GetParams(), [&](const Row& row) { out.push_back(ReadRequest(row)); });
  return out;
}

Result SqlRepository::UpdateRequest(Transaction& t, uint64_t request_id, const model::RequestUpdate& u, uint64_t now_ms,
                                    std::optional<uint64_t> expected_generation) {
  Assignments set;
  set.Set("requester", u.requester);
  set.Set("request_type", u.request_type);
  set.Set("transform_tag", u.transform_tag);
  set.Set("status", u.status);
  set.Set("locking", u.locking);
  if (u.locking) {
    if (*u.locking == REQUEST_LOCKING_IDLE) {
      set.Raw("locked_at_ms=NULL");
    } else {
      set.Add("locked_at_ms", now_ms);
    }
  }
  set.Set("priority", u.priority);
  set.Set("lifetime", u.lifetime);
  set.Set("workload_id", u.workload_id);
  set.SetMetadata("request_metadata", u.request_metadata);
  set.SetMetadata("processing_metadata", u.processing_metadata);
  set.Set("expired_at_ms", u.expired_at_ms);
  set.Add("updated_at_ms", now_ms);

  std::string sql    = "UPDATE requests SET " + set.Sql() + " WHERE request_id=?";
  Params&     params = set.MutableParams();
  params.push_back(request_id);
  if (expected_generation) {
    sql += " AND locking=? AND lease_generation=?";
    params.push_back(EnumParam(REQUEST_LOCKING_LOCKING));
    params.push_back(*expected_generation);
  }

  uint64_t affected = 0;
  auto     result   = Execute(t, sql, params, &affected);
  if (!result) return result;
  if (affected > 0) return Result::Ok();

  const auto current = GetRequest(t, request_id);
  if (!current || !expected_generation) {
    return Result::Err(ErrorCode::NotFound, "request " + std::to_string(request_id) + " not found");
  }
  return Result::Err(ErrorCode::Conflict, "request " + std::to_string(request_id) + " lease generation " +
                                              std::to_string(*expected_generation) + " is no longer held (locking=" +
                                              std::to_string(current->locking) +
                                              " generation=" + std::to_string(current->lease_generation) + ")");
}

Result SqlRepository::LockRequest(Transaction& t, uint64_t request_id, uint64_t now_ms, bool* acquired) {
  uint64_t affected = 0;
  auto     result   = Execute(t, LOCK_REQUEST, {now_ms, now_ms, request_id}, &affected);
  if (acquired) *acquired = result && affected == 1;
  return result;
}

Result SqlRepository::ReleaseExpiredLocks(Transaction& t, uint64_t locked_before_ms, uint64_t now_ms, uint64_t* released) {
  return Execute(t, RELEASE_EXPIRED_LOCKS, {now_ms, locked_before_ms}, released);
}

Result SqlRepository::DeleteRequest(Transaction& t, uint64_t request_id) {
  return ExecuteOne(t, DELETE_REQUEST, {request_id}, "request", request_id);
}

// ------------------------------------------------------------------
// Transforms
// ------------------------------------------------------------------

Result SqlRepository::InsertTransform(Transaction& t, model::TransformRecord& r) {
  Params params = {EnumParam(r.transform_type),
                   r.transform_tag,
                   r.priority,
                   EnumParam(r.status),
                   r.retries,
                   MetadataParam(r.transform_metadata),
                   r.created_at_ms,
                   r.updated_at_ms,
                   OptionalParam(r.expired_at_ms)};
  return Insert(t, INSERT_TRANSFORM, params, "transform_id", &r.transform_id);
}

std::optional<model::TransformRecord> SqlRepository::GetTransform(Transaction& t, uint64_t transform_id) {
  std::optional<model::TransformRecord> out;
  Query(t, Select(TRANSFORM_COLUMNS, "transforms") + " WHERE transform_id=?", {transform_id},
        [&](const Row& row) { out = ReadTransform(row); });
  return out;
}

std::vector<model::TransformRecord> SqlRepository::ListTransforms(Transaction& t, const TransformFilter& filter) {
  Conditions where;
  where.In("status", filter.statuses);
  if (filter.transform_type) where.Add("transform_type=?", EnumParam(*filter.transform_type));
  if (filter.transform_tag) where.Add("transform_tag=?", *filter.transform_tag);
  if (filter.updated_before_ms) where.Add("updated_at_ms<?", *filter.updated_before_ms);
  where.OrderBy("priority DESC, transform_id ASC");
  where.Limit(filter.limit);

  std::vector<model::TransformRecord> out;
  Query(t, Select(TRANSFORM_COLUMNS, "transforms") + where.Sql(), where.GetParams(),
        [&](const Row& row) { out.push_back(ReadTransform(row)); });
  return out;
}

Result SqlRepository::UpdateTransform(Transaction& t, uint64_t transform_id, const model::TransformUpdate& u, uint64_t now_ms) {
  Assignments set;
  set.Set("transform_type", u.transform_type);
  set.Set("transform_tag", u.transform_tag);
  set.Set("priority", u.priority);
  set.Set("status", u.status);
  set.Set("retries", u.retries);
  set.SetMetadata("transform_metadata", u.transform_metadata);
  set.Set("expired_at_ms", u.expired_at_ms);
  set.Add("updated_at_ms", now_ms);

  set.MutableParams().push_back(transform_id);
  return ExecuteOne(t, "UPDATE transforms SET " + set.Sql() + " WHERE transform_id=?", set.MutableParams(), "transform",
                    transform_id);
}

Result SqlRepository::DeleteTransform(Transaction& t, uint64_t transform_id) {
  return ExecuteOne(t, DELETE_TRANSFORM, {transform_id}, "transform", transform_id);
}

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

Result SqlRepository::InsertCollection(Transaction& t, model::CollectionRecord& r) {
  Params params = {r.transform_id,
                   r.scope,
                   r.name,
                   EnumParam(r.coll_type),
                   EnumParam(r.status),
                   r.bytes,
                   r.total_files,
                   r.retries,
                   MetadataParam(r.coll_metadata),
                   r.created_at_ms,
                   r.updated_at_ms,
                   OptionalParam(r.expired_at_ms)};
  return Insert(t, INSERT_COLLECTION, params, "coll_id", &r.coll_id);
}

std::optional<model::CollectionRecord> SqlRepository::GetCollection(Transaction& t, uint64_t coll_id) {
  std::optional<model::CollectionRecord> out;
  Query(t, Select(COLLECTION_COLUMNS, "collections") + " WHERE coll_id=?", {coll_id},
        [&](const Row& row) { out = ReadCollection(row); });
  return out;
}

std::vector<model::CollectionRecord> SqlRepository::ListCollections(Transaction& t, const CollectionFilter& filter) {
  Conditions where;
  if (filter.transform_id) where.Add("transform_id=?", *filter.transform_id);
  if (filter.scope) where.Add("scope=?", *filter.scope);
  if (filter.name) where.Add("name=?", *filter.name);
  where.In("status", filter.statuses);
  where.OrderBy("coll_id ASC");
  where.Limit(filter.limit);

  std::vector<model::CollectionRecord> out;
  Query(t, Select(COLLECTION_COLUMNS, "collections") + where.Sql(), where.GetParams(),
        [&](const Row& row) { out.push_back(ReadCollection(row)); });
  return out;
}

Result SqlRepository::UpdateCollection(Transaction& t, uint64_t coll_id, const model::CollectionUpdate& u, uint64_t now_ms) {
  Assignments set;
  set.Set("coll_type", u.coll_type);
  set.Set("status", u.status);
  set.Set("bytes", u.bytes);
  set.Set("total_files", u.total_files);
  set.Set("retries", u.retries);
  set.SetMetadata("coll_metadata", u.coll_metadata);
  set.Set("expired_at_ms", u.expired_at_ms);
  set.Add("updated_at_ms", now_ms);

  set.MutableParams().push_back(coll_id);
  return ExecuteOne(t, "UPDATE collections SET " + set.Sql() + " WHERE coll_id=?", set.MutableParams(), "collection",
                    coll_id);
}

Result SqlRepository::DeleteCollection(Transaction& t, uint64_t coll_id) {
  return ExecuteOne(t, DELETE_COLLECTION, {coll_id}, "collection", coll_id);
}

// ------------------------------------------------------------------
// Contents
// ------------------------------------------------------------------

Result SqlRepository::InsertContents(Transaction& t, const std::vector<model::ContentRecord>& batch, std::vector<uint64_t>* ids) {
  if (batch.empty()) return Result::Ok();

  std::vector<Params> rows;
  rows.reserve(batch.size());
  for (const auto& record : batch) {
    rows.push_back(ContentParams(record));
  }
  return InsertBatch(t, INSERT_CONTENT_PREFIX, INSERT_CONTENT_ARITY, rows, "content_id", ids);
}

std::optional<model::ContentRecord> SqlRepository::GetContent(Transaction& t, uint64_t content_id) {
  std::optional<model::ContentRecord> out;
  Query(t, Select(CONTENT_COLUMNS, "contents") + " WHERE content_id=?", {content_id},
        [&](const Row& row) { out = ReadContent(row); });
  return out;
}

std::optional<model::ContentRecord> SqlRepository::FindContent(Transaction& t, uint64_t coll_id, const model::ContentIdentity& identity) {
  auto where = IdentityConditions(coll_id, identity, false);
  std::optional<model::ContentRecord> out;
  Query(t, Select(CONTENT_COLUMNS, "contents") + where.Sql() + " LIMIT 1", where.GetParams(),
        [&](const Row& row) { out = ReadContent(row); });
  return out;
}

std::vector<model::ContentRecord> SqlRepository::MatchContents(Transaction& t, uint64_t coll_id, const model::ContentIdentity& identity) {
  auto where = IdentityConditions(coll_id, identity, true);
  std::vector<model::ContentRecord> out;
  Query(t, Select(CONTENT_COLUMNS, "contents") + where.Sql(), where.GetParams(),
        [&](const Row& row) { out.push_back(ReadContent(row)); });
  return out;
}

std::vector<model::ContentRecord> SqlRepository::ListContents(Transaction& t, const ContentFilter& filter) {
  Conditions where;
  if (filter.scope) where.Add("scope=?", *filter.scope);
  if (filter.name) where.Add("name LIKE ?", "%" + *filter.name + "%");
  if (filter.coll_id) where.Add("coll_id=?", *filter.coll_id);
  where.In("status", filter.statuses);
  where.OrderBy("content_id ASC");
  where.Limit(filter.limit);

  std::vector<model::ContentRecord> out;
  Query(t, Select(CONTENT_COLUMNS, "contents") + where.Sql(), where.GetParams(),
        [&](const Row& row) { out.push_back(ReadContent(row)); });
  return out;
}

Result SqlRepository::UpdateContent(Transaction& t, uint64_t content_id, const model::ContentUpdate& u, uint64_t now_ms) {
  Assignments set;
  set.Set("status", u.status);
  set.Set("bytes", u.bytes);
  set.Set("md5", u.md5);
  set.Set("adler32", u.adler32);
  set.Set("processing_id", u.processing_id);
  set.Set("storage_id", u.storage_id);
  set.Set("retries", u.retries);
  set.Set("path", u.path);
  set.Set("expired_at_ms", u.expired_at_ms);
  set.SetMetadata("content_metadata", u.content_metadata);
  set.Add("updated_at_ms", now_ms);

  set.MutableParams().push_back(content_id);
  return ExecuteOne(t, "UPDATE contents SET " + set.Sql() + " WHERE content_id=?", set.MutableParams(), "content",
                    content_id);
}

Result SqlRepository::UpdateContentStatuses(Transaction& t, const std::vector<ContentStatusUpdate>& updates, uint64_t now_ms) {
  for (const auto& u : updates) {
    Assignments set;
    set.Add("status", EnumParam(u.status));
    set.Set("path", u.path);
    set.Add("updated_at_ms", now_ms);

    std::string sql    = "UPDATE contents SET " + set.Sql();
    Params&     params = set.MutableParams();
    std::string what;
    if (u.content_id) {
      sql += " WHERE content_id=?";
      params.push_back(*u.content_id);
      what = "content " + std::to_string(*u.content_id);
    } else {
      if (!u.coll_id || !u.scope || !u.name || !u.min_id || !u.max_id) {
        return Result::Err(ErrorCode::InvalidArgument, "content status update needs content_id or coll_id/scope/name/min_id/max_id");
      }
      sql += " WHERE coll_id=? AND scope=? AND name=? AND min_id=? AND max_id=?";
      params.insert(params.end(), {*u.coll_id, *u.scope, *u.name, *u.min_id, *u.max_id});
      what = "content " + *u.scope + ":" + *u.name + "[" + std::to_string(*u.min_id) + "," + std::to_string(*u.max_id) +
             "] in collection " + std::to_string(*u.coll_id);
    }

    uint64_t affected = 0;
    auto     result   = Execute(t, sql, params, &affected);
    if (!result) return result;
    if (affected == 0) return Result::Err(ErrorCode::NotFound, what + " not found");
  }
  return Result::Ok();
}

Result SqlRepository::DeleteContent(Transaction& t, uint64_t content_id) {
  return ExecuteOne(t, DELETE_CONTENT, {content_id}, "content", content_id);
}

std::map<ContentStatus, uint64_t> SqlRepository::CountContentsByStatus(Transaction& t, std::optional<uint64_t> coll_id) {
  std::map<ContentStatus, uint64_t> out;
  const auto on_row = [&](const Row& row) {
    out[CheckedEnum<ContentStatus>(row.GetInt(0), ContentStatus_IsValid, "content status")] = row.GetU64(1);
  };
  if (coll_id) {
    Query(t, COUNT_COLLECTION_CONTENTS_BY_STATUS, {*coll_id}, on_row);
  } else {
    Query(t, COUNT_CONTENTS_BY_STATUS, {}, on_row);
  }
  return out;
}

} // namespace workledger::db::sql
