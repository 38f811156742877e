#include "content_service.hpp"

#include <algorithm>
#include <cstddef>
#include <set>
#include <string>
#include <type_traits>
#include <variant>

#include "internal/db/api/repository.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/db_status.hpp"
#include "internal/util/errors.hpp"

namespace workledger::service {

using namespace workledger::v1;

namespace {

constexpr uint64_t kDefaultContentLifetimeDays = 30;

std::string Describe(uint64_t coll_id, const db::model::ContentIdentity& identity) {
  return std::visit(
      [&](const auto& id) {
        std::string out = "content " + id.scope + ":" + id.name;
        if constexpr (std::is_same_v<std::decay_t<decltype(id)>, db::model::RangedIdentity>) {
          out += "[" + std::to_string(id.min_id) + "," + std::to_string(id.max_id) + "]";
        }
        return out + " in collection " + std::to_string(coll_id);
      },
      identity);
}

void ValidateContent(const db::model::ContentRecord& content) {
  if (content.coll_id == 0) {
    throw util::InvalidArgument("add content: coll_id is required");
  }
  if (content.scope.empty() || content.name.empty()) {
    throw util::InvalidArgument("add content: scope and name are required");
  }
  if (content.min_id > content.max_id) {
    throw util::InvalidArgument("add content " + content.scope + ":" + content.name + ": min_id > max_id");
  }
}

void ApplyDefaults(db::model::ContentRecord& content, uint64_t now) {
  content.content_id    = 0;
  content.created_at_ms = now;
  content.updated_at_ms = now;
  if (!content.expired_at_ms) {
    content.expired_at_ms = util::AddMillis(now, util::DaysToMillis(kDefaultContentLifetimeDays));
  }
}

} // namespace

db::model::ContentIdentity MakeContentIdentity(const std::string& scope, const std::string& name, std::optional<ContentType> content_type,
                                               std::optional<int64_t> min_id, std::optional<int64_t> max_id) {
  if (content_type && *content_type == CONTENT_TYPE_FILE) {
    return db::model::UnrangedIdentity{scope, name};
  }
  if (!min_id || !max_id) {
    throw util::InvalidArgument("content " + scope + ":" + name + ": min_id and max_id are required unless content_type is FILE");
  }
  return db::model::RangedIdentity{scope, name, *min_id, *max_id, content_type};
}

ContentService::ContentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::optional<uint64_t> ContentService::AddContent(db::model::ContentRecord content, bool returning_id) {
  return observability::ObserveOperation("ContentService.AddContent", [&] {
    std::vector<db::model::ContentRecord> one;
    one.push_back(std::move(content));
    return InsertChunked(std::move(one), 1, returning_id).front();
  });
}

std::vector<std::optional<uint64_t>> ContentService::AddContents(std::vector<db::model::ContentRecord> contents,
                                                                 std::optional<std::size_t> bulk_size, bool returning_id) {
  return observability::ObserveOperation("ContentService.AddContents", [&] {
    const std::size_t chunk = bulk_size.value_or(ctx_.content_bulk_size);
    if (chunk == 0) {
      throw util::InvalidArgument("add contents: bulk_size must be positive");
    }
    return InsertChunked(std::move(contents), chunk, returning_id);
  });
}

std::vector<std::optional<uint64_t>> ContentService::InsertChunked(std::vector<db::model::ContentRecord> contents, std::size_t chunk,
                                                                   bool returning_id) {
  std::set<uint64_t> coll_ids;
  for (const auto& content : contents) {
    ValidateContent(content);
    coll_ids.insert(content.coll_id);
  }

  std::vector<std::optional<uint64_t>> out(contents.size());
  if (contents.empty()) {
    return out;
  }

  const auto now = ctx_.NowMs();
  for (auto& content : contents) {
    ApplyDefaults(content, now);
  }

  util::RunInTransaction(*ctx_.repository, "add contents", [&](db::Transaction& tx) {
    for (const auto coll_id : coll_ids) {
      if (!ctx_.repository->GetCollection(tx, coll_id)) {
        throw util::NotFound("add contents: collection " + std::to_string(coll_id) + " not found");
      }
    }

    std::vector<uint64_t> ids;
    for (std::size_t begin = 0; begin < contents.size(); begin += chunk) {
      const std::size_t                     end = std::min(contents.size(), begin + chunk);
      std::vector<db::model::ContentRecord> batch(contents.begin() + static_cast<std::ptrdiff_t>(begin),
                                                  contents.begin() + static_cast<std::ptrdiff_t>(end));

      ids.clear();
      util::ThrowIfDbError(ctx_.repository->InsertContents(tx, batch, returning_id ? &ids : nullptr),
                           "add contents [" + std::to_string(begin) + "," + std::to_string(end) + ")");
      if (returning_id) {
        if (ids.size() != batch.size()) {
          throw util::BackendFailure("add contents: backend returned " + std::to_string(ids.size()) + " ids for " +
                                     std::to_string(batch.size()) + " rows");
        }
        std::copy(ids.begin(), ids.end(), out.begin() + static_cast<std::ptrdiff_t>(begin));
      }
    }
  });

  WORKLEDGER_LOG_DEBUG("contents added", {observability::UintField("count", contents.size()),
                                          observability::UintField("bulk_size", chunk)});
  return out;
}

uint64_t ContentService::GetContentId(uint64_t coll_id, const std::string& scope, const std::string& name,
                                      std::optional<ContentType> content_type, std::optional<int64_t> min_id,
                                      std::optional<int64_t> max_id) {
  return observability::ObserveOperation("ContentService.GetContentId", {observability::UintField("coll_id", coll_id)}, [&] {
    return FindOrThrow(coll_id, MakeContentIdentity(scope, name, content_type, min_id, max_id)).content_id;
  });
}

db::model::ContentRecord ContentService::GetContent(uint64_t content_id) {
  return observability::ObserveOperation("ContentService.GetContent", {observability::UintField("content_id", content_id)}, [&] {
    auto record = util::RunReadTransaction(*ctx_.repository, "get content",
                                           [&](db::Transaction& tx) { return ctx_.repository->GetContent(tx, content_id); });
    if (!record) {
      throw util::NotFound("content " + std::to_string(content_id) + " not found");
    }
    return *record;
  });
}

db::model::ContentRecord ContentService::GetContent(uint64_t coll_id, const db::model::ContentIdentity& identity) {
  return observability::ObserveOperation("ContentService.FindContent", {observability::UintField("coll_id", coll_id)},
                                         [&] { return FindOrThrow(coll_id, identity); });
}

db::model::ContentRecord ContentService::FindOrThrow(uint64_t coll_id, const db::model::ContentIdentity& identity) {
  auto record = util::RunReadTransaction(*ctx_.repository, "find content",
                                         [&](db::Transaction& tx) { return ctx_.repository->FindContent(tx, coll_id, identity); });
  if (!record) {
    throw util::NotFound(Describe(coll_id, identity) + " not found");
  }
  return *record;
}

std::vector<db::model::ContentRecord> ContentService::MatchContents(uint64_t coll_id, const std::string& scope, const std::string& name,
                                                                    std::optional<ContentType> content_type, std::optional<int64_t> min_id,
                                                                    std::optional<int64_t> max_id) {
  return observability::ObserveOperation("ContentService.MatchContents", {observability::UintField("coll_id", coll_id)}, [&] {
    // Without a type or a complete range every content under the name matches.
    const auto identity = !content_type && (!min_id || !max_id) ? db::model::ContentIdentity(db::model::NamedIdentity{scope, name})
                                                                : MakeContentIdentity(scope, name, content_type, min_id, max_id);
    return util::RunReadTransaction(*ctx_.repository, "match contents",
                                    [&](db::Transaction& tx) { return ctx_.repository->MatchContents(tx, coll_id, identity); });
  });
}

std::vector<db::model::ContentRecord> ContentService::ListContents(const db::ContentFilter& filter) {
  return observability::ObserveOperation("ContentService.ListContents", [&] {
    if (filter.scope.has_value() != filter.name.has_value()) {
      throw util::InvalidArgument("list contents: scope and name must be given together");
    }
    if (!filter.scope && !filter.coll_id && filter.statuses.empty()) {
      throw util::InvalidArgument("list contents: one of scope+name, coll_id or statuses is required");
    }
    return util::RunReadTransaction(*ctx_.repository, "list contents",
                                    [&](db::Transaction& tx) { return ctx_.repository->ListContents(tx, filter); });
  });
}

void ContentService::UpdateContent(uint64_t content_id, const db::model::ContentUpdate& update) {
  observability::ObserveOperation("ContentService.UpdateContent", [&] {
    util::RunInTransaction(*ctx_.repository, "update content", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->UpdateContent(tx, content_id, update, ctx_.NowMs()),
                           "update content " + std::to_string(content_id));
    });
  });
}

void ContentService::UpdateContents(const std::vector<db::ContentStatusUpdate>& updates) {
  observability::ObserveOperation("ContentService.UpdateContents", [&] {
    for (const auto& u : updates) {
      if (!u.content_id && !(u.coll_id && u.scope && u.name && u.min_id && u.max_id)) {
        throw util::InvalidArgument("update contents: each entry needs content_id or coll_id/scope/name/min_id/max_id");
      }
    }
    if (updates.empty()) {
      return;
    }
    util::RunInTransaction(*ctx_.repository, "update contents", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->UpdateContentStatuses(tx, updates, ctx_.NowMs()), "update contents");
    });
  });
}

void ContentService::DeleteContent(uint64_t content_id) {
  observability::ObserveOperation("ContentService.DeleteContent", [&] {
    util::RunInTransaction(*ctx_.repository, "delete content", [&](db::Transaction& tx) {
      util::ThrowIfDbError(ctx_.repository->DeleteContent(tx, content_id), "delete content " + std::to_string(content_id));
    });
  });
}

} // namespace workledger::service
