#include "memory_repository.hpp"

#include <algorithm>
#include <string>
#include <type_traits>
#include <variant>

#include "memory_tx.hpp"

namespace workledger::db::memory {

using namespace workledger::v1;

namespace {

template <typename T>
bool Contains(const std::vector<T>& values, T value) {
  return values.empty() || std::find(values.begin(), values.end(), value) != values.end();
}

template <typename Record>
void Truncate(std::vector<Record>& out, const std::optional<std::size_t>& limit) {
  if (limit && out.size() > *limit) out.resize(*limit);
}

template <typename T>
void Assign(T& field, const std::optional<T>& value) {
  if (value) field = *value;
}

template <typename T>
void Assign(std::optional<T>& field, const std::optional<T>& value) {
  if (value) field = value;
}

bool MatchesIdentity(const model::ContentRecord& c, const model::ContentIdentity& identity, bool covering) {
  return std::visit(
      [&](const auto& id) {
        using T = std::decay_t<decltype(id)>;
        if (c.scope != id.scope || c.name != id.name) return false;
        if constexpr (std::is_same_v<T, model::UnrangedIdentity>) {
          return c.content_type == CONTENT_TYPE_FILE;
        } else if constexpr (std::is_same_v<T, model::NamedIdentity>) {
          return true;
        } else {
          if (id.content_type && c.content_type != *id.content_type) return false;
          if (covering) return c.min_id <= id.min_id && c.max_id >= id.max_id;
          return c.min_id == id.min_id && c.max_id == id.max_id;
        }
      },
      identity);
}

Result NotFound(const char* what, uint64_t id) {
  return Result::Err(ErrorCode::NotFound, std::string(what) + " " + std::to_string(id) + " not found");
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result MemoryRepository::InsertRequest(Transaction& t, model::RequestRecord& r) {
  auto& s      = TX(t).Mutable();
  r.request_id = s.next_request_id++;
  s.requests[r.request_id] = r;
  return Result::Ok();
}

std::optional<model::RequestRecord> MemoryRepository::GetRequest(Transaction& t, uint64_t request_id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(request_id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

std::optional<model::RequestRecord> MemoryRepository::GetRequestByWorkload(Transaction& t, int64_t workload_id) {
  for (const auto& [_, r] : TX(t).View().requests) {
    if (r.workload_id && *r.workload_id == workload_id) return r;
  }
  return std::nullopt;
}

std::vector<model::RequestRecord> MemoryRepository::ListRequests(Transaction& t, const RequestFilter& filter) {
  std::vector<model::RequestRecord> out;
  for (const auto& [_, r] : TX(t).View().requests) {
    if (!Contains(filter.statuses, r.status)) continue;
    if (filter.request_type && r.request_type != *filter.request_type) continue;
    if (filter.updated_before_ms && !(r.updated_at_ms < *filter.updated_before_ms)) continue;
    if (filter.only_idle && r.locking != REQUEST_LOCKING_IDLE) continue;
    out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.priority > b.priority; });
  Truncate(out, filter.limit);
  return out;
}

Result MemoryRepository::UpdateRequest(Transaction& t, uint64_t request_id, const model::RequestUpdate& u, uint64_t now_ms,
                                       std::optional<uint64_t> expected_generation) {
  auto& s  = TX(t).Mutable();
  auto  it = s.requests.find(request_id);
  if (it == s.requests.end()) return NotFound("request", request_id);

  auto& r = it->second;
  if (expected_generation && (r.locking != REQUEST_LOCKING_LOCKING || r.lease_generation != *expected_generation)) {
    return Result::Err(ErrorCode::Conflict, "request " + std::to_string(request_id) + " lease generation " +
                                                std::to_string(*expected_generation) + " is no longer held");
  }

  Assign(r.requester, u.requester);
  Assign(r.request_type, u.request_type);
  Assign(r.transform_tag, u.transform_tag);
  Assign(r.status, u.status);
  if (u.locking) {
    r.locking      = *u.locking;
    r.locked_at_ms = *u.locking == REQUEST_LOCKING_IDLE ? std::nullopt : std::optional<uint64_t>(now_ms);
  }
  Assign(r.priority, u.priority);
  Assign(r.lifetime, u.lifetime);
  Assign(r.workload_id, u.workload_id);
  Assign(r.request_metadata, u.request_metadata);
  Assign(r.processing_metadata, u.processing_metadata);
  Assign(r.expired_at_ms, u.expired_at_ms);
  r.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::LockRequest(Transaction& t, uint64_t request_id, uint64_t now_ms, bool* acquired) {
  if (acquired) *acquired = false;
  const auto& view = TX(t).View().requests;
  if (auto found = view.find(request_id); found == view.end() || found->second.locking != REQUEST_LOCKING_IDLE) return Result::Ok();

  auto& s  = TX(t).Mutable();
  auto  it = s.requests.find(request_id);

  auto& r = it->second;
  r.locking       = REQUEST_LOCKING_LOCKING;
  r.locked_at_ms  = now_ms;
  r.updated_at_ms = now_ms;
  ++r.lease_generation;
  if (acquired) *acquired = true;
  return Result::Ok();
}

Result MemoryRepository::ReleaseExpiredLocks(Transaction& t, uint64_t locked_before_ms, uint64_t now_ms, uint64_t* released) {
  const auto expired = [&](const model::RequestRecord& r) {
    return r.locking == REQUEST_LOCKING_LOCKING && r.locked_at_ms && *r.locked_at_ms < locked_before_ms;
  };

  uint64_t count = 0;
  const auto& view = TX(t).View().requests;
  if (std::none_of(view.begin(), view.end(), [&](const auto& entry) { return expired(entry.second); })) {
    if (released) *released = 0;
    return Result::Ok();
  }

  for (auto& [_, r] : TX(t).Mutable().requests) {
    if (!expired(r)) continue;
    r.locking       = REQUEST_LOCKING_IDLE;
    r.locked_at_ms  = std::nullopt;
    r.updated_at_ms = now_ms;
    ++count;
  }
  if (released) *released = count;
  return Result::Ok();
}

Result MemoryRepository::DeleteRequest(Transaction& t, uint64_t request_id) {
  if (TX(t).Mutable().requests.erase(request_id) == 0) return NotFound("request", request_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Transforms
// ------------------------------------------------------------------

Result MemoryRepository::InsertTransform(Transaction& t, model::TransformRecord& r) {
  auto& s        = TX(t).Mutable();
  r.transform_id = s.next_transform_id++;
  s.transforms[r.transform_id] = r;
  return Result::Ok();
}

std::optional<model::TransformRecord> MemoryRepository::GetTransform(Transaction& t, uint64_t transform_id) {
  const auto& s  = TX(t).View();
  auto        it = s.transforms.find(transform_id);
  if (it == s.transforms.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TransformRecord> MemoryRepository::ListTransforms(Transaction& t, const TransformFilter& filter) {
  std::vector<model::TransformRecord> out;
  for (const auto& [_, r] : TX(t).View().transforms) {
    if (!Contains(filter.statuses, r.status)) continue;
    if (filter.transform_type && r.transform_type != *filter.transform_type) continue;
    if (filter.transform_tag && r.transform_tag != *filter.transform_tag) continue;
    if (filter.updated_before_ms && !(r.updated_at_ms < *filter.updated_before_ms)) continue;
    out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.priority > b.priority; });
  Truncate(out, filter.limit);
  return out;
}

Result MemoryRepository::UpdateTransform(Transaction& t, uint64_t transform_id, const model::TransformUpdate& u, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.transforms.find(transform_id);
  if (it == s.transforms.end()) return NotFound("transform", transform_id);

  auto& r = it->second;
  Assign(r.transform_type, u.transform_type);
  Assign(r.transform_tag, u.transform_tag);
  Assign(r.priority, u.priority);
  Assign(r.status, u.status);
  Assign(r.retries, u.retries);
  Assign(r.transform_metadata, u.transform_metadata);
  Assign(r.expired_at_ms, u.expired_at_ms);
  r.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteTransform(Transaction& t, uint64_t transform_id) {
  auto& s = TX(t).Mutable();
  if (s.transforms.erase(transform_id) == 0) return NotFound("transform", transform_id);

  for (auto it = s.collections.begin(); it != s.collections.end();) {
    if (it->second.transform_id != transform_id) {
      ++it;
      continue;
    }
    const auto coll_id = it->first;
    it                 = s.collections.erase(it);
    std::erase_if(s.contents, [coll_id](const auto& entry) { return entry.second.coll_id == coll_id; });
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

Result MemoryRepository::InsertCollection(Transaction& t, model::CollectionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.transforms.contains(r.transform_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: transform " + std::to_string(r.transform_id));
  }
  for (const auto& [_, c] : s.collections) {
    if (c.transform_id == r.transform_id && c.scope == r.scope && c.name == r.name) {
      return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: collections.transform_id, collections.scope, collections.name");
    }
  }
  r.coll_id = s.next_collection_id++;
  s.collections[r.coll_id] = r;
  return Result::Ok();
}

std::optional<model::CollectionRecord> MemoryRepository::GetCollection(Transaction& t, uint64_t coll_id) {
  const auto& s  = TX(t).View();
  auto        it = s.collections.find(coll_id);
  if (it == s.collections.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CollectionRecord> MemoryRepository::ListCollections(Transaction& t, const CollectionFilter& filter) {
  std::vector<model::CollectionRecord> out;
  for (const auto& [_, c] : TX(t).View().collections) {
    if (filter.transform_id && c.transform_id != *filter.transform_id) continue;
    if (filter.scope && c.scope != *filter.scope) continue;
    if (filter.name && c.name != *filter.name) continue;
    if (!Contains(filter.statuses, c.status)) continue;
    out.push_back(c);
  }
  Truncate(out, filter.limit);
  return out;
}

Result MemoryRepository::UpdateCollection(Transaction& t, uint64_t coll_id, const model::CollectionUpdate& u, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.collections.find(coll_id);
  if (it == s.collections.end()) return NotFound("collection", coll_id);

  auto& c = it->second;
  Assign(c.coll_type, u.coll_type);
  Assign(c.status, u.status);
  Assign(c.bytes, u.bytes);
  Assign(c.total_files, u.total_files);
  Assign(c.retries, u.retries);
  Assign(c.coll_metadata, u.coll_metadata);
  Assign(c.expired_at_ms, u.expired_at_ms);
  c.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteCollection(Transaction& t, uint64_t coll_id) {
  auto& s = TX(t).Mutable();
  if (s.collections.erase(coll_id) == 0) return NotFound("collection", coll_id);
  std::erase_if(s.contents, [coll_id](const auto& entry) { return entry.second.coll_id == coll_id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Contents
// ------------------------------------------------------------------

Result MemoryRepository::CheckContentUnique(const State& s, const model::ContentRecord& r) {
  for (const auto& [_, c] : s.contents) {
    if (c.coll_id != r.coll_id || c.scope != r.scope || c.name != r.name || c.content_type != r.content_type) continue;
    if (r.content_type == CONTENT_TYPE_FILE || (c.min_id == r.min_id && c.max_id == r.max_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: contents " + r.scope + ":" + r.name + " [" +
                                                             std::to_string(r.min_id) + "," + std::to_string(r.max_id) + "]");
    }
  }
  return Result::Ok();
}

Result MemoryRepository::InsertContents(Transaction& t, const std::vector<model::ContentRecord>& batch, std::vector<uint64_t>* ids) {
  auto& s = TX(t).Mutable();
  if (ids) {
    ids->clear();
    ids->reserve(batch.size());
  }

  for (auto record : batch) {
    if (!s.collections.contains(record.coll_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed: collection " + std::to_string(record.coll_id));
    }
    if (auto unique = CheckContentUnique(s, record); !unique) return unique;

    record.content_id = s.next_content_id++;
    if (ids) ids->push_back(record.content_id);
    s.contents[record.content_id] = std::move(record);
  }
  return Result::Ok();
}

std::optional<model::ContentRecord> MemoryRepository::GetContent(Transaction& t, uint64_t content_id) {
  const auto& s  = TX(t).View();
  auto        it = s.contents.find(content_id);
  if (it == s.contents.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ContentRecord> MemoryRepository::FindContent(Transaction& t, uint64_t coll_id, const model::ContentIdentity& identity) {
  for (const auto& [_, c] : TX(t).View().contents) {
    if (c.coll_id == coll_id && MatchesIdentity(c, identity, false)) return c;
  }
  return std::nullopt;
}

std::vector<model::ContentRecord> MemoryRepository::MatchContents(Transaction& t, uint64_t coll_id, const model::ContentIdentity& identity) {
  std::vector<model::ContentRecord> out;
  for (const auto& [_, c] : TX(t).View().contents) {
    if (c.coll_id == coll_id && MatchesIdentity(c, identity, true)) out.push_back(c);
  }
  return out;
}

std::vector<model::ContentRecord> MemoryRepository::ListContents(Transaction& t, const ContentFilter& filter) {
  std::vector<model::ContentRecord> out;
  for (const auto& [_, c] : TX(t).View().contents) {
    if (filter.scope && c.scope != *filter.scope) continue;
    if (filter.name && c.name.find(*filter.name) == std::string::npos) continue;
    if (filter.coll_id && c.coll_id != *filter.coll_id) continue;
    if (!Contains(filter.statuses, c.status)) continue;
    out.push_back(c);
  }
  Truncate(out, filter.limit);
  return out;
}

Result MemoryRepository::UpdateContent(Transaction& t, uint64_t content_id, const model::ContentUpdate& u, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.contents.find(content_id);
  if (it == s.contents.end()) return NotFound("content", content_id);

  auto& c = it->second;
  Assign(c.status, u.status);
  Assign(c.bytes, u.bytes);
  Assign(c.md5, u.md5);
  Assign(c.adler32, u.adler32);
  Assign(c.processing_id, u.processing_id);
  Assign(c.storage_id, u.storage_id);
  Assign(c.retries, u.retries);
  Assign(c.path, u.path);
  Assign(c.expired_at_ms, u.expired_at_ms);
  Assign(c.content_metadata, u.content_metadata);
  c.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::UpdateContentStatuses(Transaction& t, const std::vector<ContentStatusUpdate>& updates, uint64_t now_ms) {
  auto& s = TX(t).Mutable();
  for (const auto& u : updates) {
    bool matched = false;
    if (u.content_id) {
      auto it = s.contents.find(*u.content_id);
      if (it == s.contents.end()) return NotFound("content", *u.content_id);
      it->second.status = u.status;
      Assign(it->second.path, u.path);
      it->second.updated_at_ms = now_ms;
      continue;
    }

    if (!u.coll_id || !u.scope || !u.name || !u.min_id || !u.max_id) {
      return Result::Err(ErrorCode::InvalidArgument, "content status update needs content_id or coll_id/scope/name/min_id/max_id");
    }
    for (auto& [_, c] : s.contents) {
      if (c.coll_id != *u.coll_id || c.scope != *u.scope || c.name != *u.name || c.min_id != *u.min_id || c.max_id != *u.max_id) continue;
      c.status = u.status;
      Assign(c.path, u.path);
      c.updated_at_ms = now_ms;
      matched         = true;
    }
    if (!matched) {
      return Result::Err(ErrorCode::NotFound, "content " + *u.scope + ":" + *u.name + " in collection " + std::to_string(*u.coll_id) + " not found");
    }
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteContent(Transaction& t, uint64_t content_id) {
  if (TX(t).Mutable().contents.erase(content_id) == 0) return NotFound("content", content_id);
  return Result::Ok();
}

std::map<ContentStatus, uint64_t> MemoryRepository::CountContentsByStatus(Transaction& t, std::optional<uint64_t> coll_id) {
  std::map<ContentStatus, uint64_t> out;
  for (const auto& [_, c] : TX(t).View().contents) {
    if (coll_id && c.coll_id != *coll_id) continue;
    ++out[c.status];
  }
  return out;
}

} // namespace workledger::db::memory
