#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/collection_service.hpp"
#include "internal/service/content_service.hpp"
#include "internal/service/progress_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transform_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace workledger::v1;
using workledger::db::model::CollectionRecord;
using workledger::db::model::ContentRecord;
using workledger::db::model::TransformRecord;

constexpr uint64_t kStartMs = 1'700'000'000'000;

// Counts batched insert statements so chunking is observable.
class CountingRepository : public workledger::db::memory::MemoryRepository {
 public:
  workledger::db::Result InsertContents(workledger::db::Transaction& tx, const std::vector<ContentRecord>& batch,
                                        std::vector<uint64_t>* ids) override {
    ++insert_calls;
    batch_sizes.push_back(batch.size());
    return MemoryRepository::InsertContents(tx, batch, ids);
  }

  int                      insert_calls = 0;
  std::vector<std::size_t> batch_sizes;
};

struct Fixture {
  std::shared_ptr<CountingRepository>  repository = std::make_shared<CountingRepository>();
  workledger::service::ServiceContext  ctx;
  uint64_t                             coll_id = 0;

  Fixture() {
    ctx.repository = repository;
    ctx.now        = [] { return workledger::util::FromUnixMillis(kStartMs); };

    TransformRecord transform;
    transform.transform_tag = "derive";
    const auto transform_id = workledger::service::TransformService(ctx).AddTransform(transform);

    CollectionRecord collection;
    collection.transform_id = transform_id;
    collection.scope        = "mc16";
    collection.name         = "input.dataset";
    coll_id                 = workledger::service::CollectionService(ctx).AddCollection(collection);
  }

  workledger::service::ContentService Contents() const {
    return workledger::service::ContentService(ctx);
  }
};

ContentRecord MakeFile(uint64_t coll_id, const std::string& name) {
  ContentRecord content;
  content.coll_id      = coll_id;
  content.scope        = "mc16";
  content.name         = name;
  content.content_type = CONTENT_TYPE_FILE;
  content.bytes        = 1024;
  return content;
}

ContentRecord MakeEvents(uint64_t coll_id, const std::string& name, int64_t min_id, int64_t max_id) {
  ContentRecord content;
  content.coll_id      = coll_id;
  content.scope        = "mc16";
  content.name         = name;
  content.content_type = CONTENT_TYPE_EVENT;
  content.min_id       = min_id;
  content.max_id       = max_id;
  return content;
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const workledger::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestAddContentsChunksAndReturnsIdsInOrder() {
  Fixture f;
  auto    contents = f.Contents();

  std::vector<ContentRecord> batch;
  for (int i = 0; i < 7; ++i) {
    batch.push_back(MakeFile(f.coll_id, "file." + std::to_string(i)));
  }

  const auto ids = contents.AddContents(batch, 3, true);
  assert(ids.size() == 7);
  assert(f.repository->insert_calls == 3);
  assert((f.repository->batch_sizes == std::vector<std::size_t>{3, 3, 1}));

  for (std::size_t i = 0; i < ids.size(); ++i) {
    assert(ids[i].has_value());
    if (i > 0) {
      assert(*ids[i] > *ids[i - 1]);
    }
    const auto stored = contents.GetContent(*ids[i]);
    assert(stored.name == "file." + std::to_string(i));
    assert(stored.created_at_ms == kStartMs);
    assert(stored.expired_at_ms == kStartMs + workledger::util::DaysToMillis(30));
  }
}

void TestAddContentsWithoutIdsUsesContextBulkSize() {
  Fixture f;
  f.ctx.content_bulk_size = 2;
  auto contents           = f.Contents();

  std::vector<ContentRecord> batch;
  for (int i = 0; i < 5; ++i) {
    batch.push_back(MakeEvents(f.coll_id, "events", i * 100, i * 100 + 99));
  }

  const auto ids = contents.AddContents(batch);
  assert(ids.size() == 5);
  for (const auto& id : ids) {
    assert(!id.has_value());
  }
  assert(f.repository->insert_calls == 3);

  workledger::db::ContentFilter filter;
  filter.coll_id = f.coll_id;
  assert(contents.ListContents(filter).size() == 5);
}

void TestDuplicateFileFailsWholeCall() {
  Fixture f;
  auto    contents = f.Contents();

  (void)contents.AddContent(MakeFile(f.coll_id, "dup.root"));

  std::vector<ContentRecord> batch = {MakeFile(f.coll_id, "fresh.1"), MakeFile(f.coll_id, "fresh.2"),
                                      MakeFile(f.coll_id, "dup.root")};

  bool duplicate = false;
  try {
    (void)contents.AddContents(batch, 2, true);
  } catch (const workledger::util::Duplicate&) {
    duplicate = true;
  }
  assert(duplicate);

  workledger::db::ContentFilter filter;
  filter.coll_id = f.coll_id;
  assert(contents.ListContents(filter).size() == 1);
}

void TestAddContentsValidatesBeforeWriting() {
  Fixture f;
  auto    contents = f.Contents();

  assert(ThrowsInvalidArgument([&] { (void)contents.AddContents({MakeFile(f.coll_id, "a")}, 0); }));
  assert(ThrowsInvalidArgument([&] { (void)contents.AddContent(MakeFile(0, "a")); }));
  assert(ThrowsInvalidArgument([&] { (void)contents.AddContent(MakeFile(f.coll_id, "")); }));
  assert(ThrowsInvalidArgument([&] { (void)contents.AddContent(MakeEvents(f.coll_id, "reversed", 10, 5)); }));
  assert(f.repository->insert_calls == 0);

  bool not_found = false;
  try {
    (void)contents.AddContent(MakeFile(f.coll_id + 100, "orphan"));
  } catch (const workledger::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
  assert(f.repository->insert_calls == 0);
}

void TestGetContentIdByIdentity() {
  Fixture f;
  auto    contents = f.Contents();

  const auto file_id   = contents.AddContent(MakeFile(f.coll_id, "lookup.root"));
  const auto events_id = contents.AddContent(MakeEvents(f.coll_id, "lookup.events", 0, 999));
  assert(file_id && events_id);

  assert(contents.GetContentId(f.coll_id, "mc16", "lookup.root", CONTENT_TYPE_FILE) == *file_id);
  assert(contents.GetContentId(f.coll_id, "mc16", "lookup.events", std::nullopt, 0, 999) == *events_id);
  assert(contents.GetContentId(f.coll_id, "mc16", "lookup.events", CONTENT_TYPE_EVENT, 0, 999) == *events_id);

  bool not_found = false;
  try {
    (void)contents.GetContentId(f.coll_id, "mc16", "lookup.events", std::nullopt, 0, 500);
  } catch (const workledger::util::NotFound& e) {
    not_found = std::string(e.what()).find("lookup.events") != std::string::npos;
  }
  assert(not_found);

  assert(ThrowsInvalidArgument([&] { (void)contents.GetContentId(f.coll_id, "mc16", "lookup.events"); }));
  assert(ThrowsInvalidArgument([&] { (void)contents.GetContentId(f.coll_id, "mc16", "lookup.events", CONTENT_TYPE_EVENT, 0); }));
}

void TestDefaultBulkSizeSplitsLargeBatch() {
  Fixture f;
  f.ctx.content_bulk_size = 100;
  auto contents           = f.Contents();

  std::vector<ContentRecord> batch;
  for (int i = 0; i < 250; ++i) {
    batch.push_back(MakeFile(f.coll_id, "bulk." + std::to_string(i)));
  }

  const auto ids = contents.AddContents(batch, std::nullopt, true);
  assert(ids.size() == 250);
  assert(f.repository->insert_calls == 3);
  assert((f.repository->batch_sizes == std::vector<std::size_t>{100, 100, 50}));

  std::set<uint64_t> distinct;
  for (const auto& id : ids) {
    assert(id.has_value());
    distinct.insert(*id);
  }
  assert(distinct.size() == 250);

  workledger::db::ContentFilter filter;
  filter.coll_id = f.coll_id;
  assert(contents.ListContents(filter).size() == 250);
}

void TestFileDuplicateIgnoresRange() {
  Fixture f;
  auto    contents = f.Contents();

  (void)contents.AddContent(MakeFile(f.coll_id, "unranged.root"));

  auto shifted   = MakeFile(f.coll_id, "unranged.root");
  shifted.min_id = 10;
  shifted.max_id = 20;

  bool duplicate = false;
  try {
    (void)contents.AddContent(shifted);
  } catch (const workledger::util::Duplicate&) {
    duplicate = true;
  }
  assert(duplicate);

  // Event ranges with the same name are distinct contents.
  (void)contents.AddContents({MakeEvents(f.coll_id, "unranged.root", 10, 20), MakeEvents(f.coll_id, "unranged.root", 21, 30)});
  assert(contents.MatchContents(f.coll_id, "mc16", "unranged.root").size() == 3);
}

void TestFailedAddContentIsReportedOnce() {
  Fixture f;
  auto    contents = f.Contents();
  (void)contents.AddContent(MakeFile(f.coll_id, "reported.root"));

  std::ostringstream captured;
  auto               previous = spdlog::default_logger();
  auto               capture  = std::make_shared<spdlog::logger>("capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
  capture->set_pattern("%v");
  capture->set_level(spdlog::level::info);
  spdlog::set_default_logger(capture);

  bool duplicate = false;
  try {
    (void)contents.AddContent(MakeFile(f.coll_id, "reported.root"));
  } catch (const workledger::util::Duplicate&) {
    duplicate = true;
  }
  spdlog::set_default_logger(previous);
  assert(duplicate);

  const auto  text     = captured.str();
  std::size_t failures = 0;
  for (auto pos = text.find("operation failed"); pos != std::string::npos; pos = text.find("operation failed", pos + 1)) {
    ++failures;
  }
  assert(failures == 1);
  assert(text.find("operation=ContentService.AddContent ") != std::string::npos);
  assert(text.find("ContentService.AddContents") == std::string::npos);
}

void TestMatchContentsReturnsCoveringRanges() {
  Fixture f;
  auto    contents = f.Contents();

  (void)contents.AddContents({MakeEvents(f.coll_id, "range", 0, 999), MakeEvents(f.coll_id, "range", 1000, 1999),
                              MakeEvents(f.coll_id, "range", 0, 1999)});

  const auto inner = contents.MatchContents(f.coll_id, "mc16", "range", std::nullopt, 100, 200);
  assert(inner.size() == 2);

  const auto spanning = contents.MatchContents(f.coll_id, "mc16", "range", std::nullopt, 900, 1100);
  assert(spanning.size() == 1);
  assert(spanning[0].min_id == 0 && spanning[0].max_id == 1999);

  assert(contents.MatchContents(f.coll_id, "mc16", "range", std::nullopt, 2000, 2100).empty());
}

void TestMatchContentsWithoutTypeOrRangeMatchesByName() {
  Fixture f;
  auto    contents = f.Contents();

  const auto ids = contents.AddContents({MakeEvents(f.coll_id, "named", 0, 999), MakeEvents(f.coll_id, "named", 1000, 1999),
                                         MakeFile(f.coll_id, "named"), MakeFile(f.coll_id, "unrelated")},
                                        std::nullopt, true);

  const auto all = contents.MatchContents(f.coll_id, "mc16", "named");
  assert(all.size() == 3);
  assert(all[0].content_id == *ids[0]);
  assert(all[1].content_id == *ids[1]);
  assert(all[2].content_id == *ids[2]);

  // A half-open range does not narrow the match either.
  assert(contents.MatchContents(f.coll_id, "mc16", "named", std::nullopt, 500).size() == 3);

  const auto files = contents.MatchContents(f.coll_id, "mc16", "named", CONTENT_TYPE_FILE);
  assert(files.size() == 1);
  assert(files[0].content_id == *ids[2]);

  assert(contents.MatchContents(f.coll_id, "mc16", "missing").empty());
  assert(contents.MatchContents(f.coll_id + 1, "mc16", "named").empty());
  assert(ThrowsInvalidArgument([&] { (void)contents.MatchContents(f.coll_id, "mc16", "named", CONTENT_TYPE_EVENT); }));
}

void TestListContentsValidation() {
  Fixture f;
  auto    contents = f.Contents();

  (void)contents.AddContents({MakeFile(f.coll_id, "user.alpha.1"), MakeFile(f.coll_id, "user.beta.1")});

  assert(ThrowsInvalidArgument([&] { (void)contents.ListContents({}); }));

  workledger::db::ContentFilter scope_only;
  scope_only.scope = "mc16";
  assert(ThrowsInvalidArgument([&] { (void)contents.ListContents(scope_only); }));

  workledger::db::ContentFilter by_name;
  by_name.scope = "mc16";
  by_name.name  = "alpha";
  const auto matched = contents.ListContents(by_name);
  assert(matched.size() == 1);
  assert(matched[0].name == "user.alpha.1");

  workledger::db::ContentFilter by_status;
  by_status.statuses = {CONTENT_STATUS_NEW};
  assert(contents.ListContents(by_status).size() == 2);
}

void TestListContentsMatchesScopeExactly() {
  Fixture f;
  auto    contents = f.Contents();

  auto sibling  = MakeFile(f.coll_id, "user.alpha.2");
  sibling.scope = "mc16_x";
  (void)contents.AddContents({MakeFile(f.coll_id, "user.alpha.1"), sibling});

  workledger::db::ContentFilter filter;
  filter.scope       = "mc16";
  filter.name        = "alpha";
  const auto matched = contents.ListContents(filter);
  assert(matched.size() == 1);
  assert(matched[0].scope == "mc16");
  assert(matched[0].name == "user.alpha.1");

  filter.scope = "mc16_x";
  assert(contents.ListContents(filter).size() == 1);

  filter.scope = "mc";
  assert(contents.ListContents(filter).empty());
}

void TestUpdateContentsByIdentityAndCount() {
  Fixture f;
  auto    contents = f.Contents();

  const auto ids = contents.AddContents({MakeEvents(f.coll_id, "status", 0, 99), MakeEvents(f.coll_id, "status", 100, 199),
                                         MakeFile(f.coll_id, "status.root")},
                                        std::nullopt, true);

  workledger::db::ContentStatusUpdate by_identity;
  by_identity.coll_id = f.coll_id;
  by_identity.scope   = "mc16";
  by_identity.name    = "status";
  by_identity.min_id  = 0;
  by_identity.max_id  = 99;
  by_identity.status  = CONTENT_STATUS_AVAILABLE;
  by_identity.path    = "/data/status.0";

  workledger::db::ContentStatusUpdate by_id;
  by_id.content_id = ids[2];
  by_id.status     = CONTENT_STATUS_FAILED;

  contents.UpdateContents({by_identity, by_id});
  contents.UpdateContents({});

  const auto first = contents.GetContent(*ids[0]);
  assert(first.status == CONTENT_STATUS_AVAILABLE);
  assert(first.path == "/data/status.0");
  assert(contents.GetContent(*ids[1]).status == CONTENT_STATUS_NEW);
  assert(contents.GetContent(*ids[2]).status == CONTENT_STATUS_FAILED);

  workledger::db::ContentStatusUpdate incomplete;
  incomplete.coll_id = f.coll_id;
  incomplete.scope   = "mc16";
  assert(ThrowsInvalidArgument([&] { contents.UpdateContents({incomplete}); }));

  workledger::service::ProgressService progress(f.ctx);
  const auto                           counts = progress.CountByStatus(f.coll_id);
  assert(counts.at(CONTENT_STATUS_AVAILABLE) == 1);
  assert(counts.at(CONTENT_STATUS_NEW) == 1);
  assert(counts.at(CONTENT_STATUS_FAILED) == 1);
  assert(progress.CountByStatus(f.coll_id + 100).empty());
}

void TestCountByStatusIsExact() {
  Fixture f;
  auto    contents = f.Contents();

  std::vector<ContentRecord> batch;
  for (int i = 0; i < 5; ++i) {
    auto content = MakeFile(f.coll_id, "count." + std::to_string(i));
    if (i >= 3) {
      content.status = CONTENT_STATUS_FAILED;
    }
    batch.push_back(content);
  }
  (void)contents.AddContents(batch);

  workledger::service::ProgressService progress(f.ctx);
  const std::map<ContentStatus, uint64_t> expected{{CONTENT_STATUS_NEW, 3}, {CONTENT_STATUS_FAILED, 2}};
  assert(progress.CountByStatus(f.coll_id) == expected);
  assert(progress.CountByStatus() == expected);
}

void TestUpdateAndDeleteSingleContent() {
  Fixture f;
  auto    contents = f.Contents();

  const auto id = *contents.AddContent(MakeFile(f.coll_id, "single.root"));

  workledger::db::model::ContentUpdate update;
  update.md5     = "d41d8cd98f00b204e9800998ecf8427e";
  update.retries = 2;
  contents.UpdateContent(id, update);

  const auto stored = contents.GetContent(id);
  assert(stored.md5 == "d41d8cd98f00b204e9800998ecf8427e");
  assert(stored.retries == 2);
  assert(stored.bytes == 1024);

  contents.DeleteContent(id);
  bool not_found = false;
  try {
    (void)contents.GetContent(id);
  } catch (const workledger::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestMakeContentIdentity() {
  const auto file = workledger::service::MakeContentIdentity("s", "n", CONTENT_TYPE_FILE);
  assert(std::holds_alternative<workledger::db::model::UnrangedIdentity>(file));

  const auto ranged = workledger::service::MakeContentIdentity("s", "n", std::nullopt, 1, 2);
  assert(std::holds_alternative<workledger::db::model::RangedIdentity>(ranged));
  assert(!std::get<workledger::db::model::RangedIdentity>(ranged).content_type.has_value());

  assert(ThrowsInvalidArgument([] { (void)workledger::service::MakeContentIdentity("s", "n"); }));
}

} // namespace

int main() {
  TestAddContentsChunksAndReturnsIdsInOrder();
  TestAddContentsWithoutIdsUsesContextBulkSize();
  TestDuplicateFileFailsWholeCall();
  TestAddContentsValidatesBeforeWriting();
  TestGetContentIdByIdentity();
  TestDefaultBulkSizeSplitsLargeBatch();
  TestFileDuplicateIgnoresRange();
  TestFailedAddContentIsReportedOnce();
  TestMatchContentsReturnsCoveringRanges();
  TestMatchContentsWithoutTypeOrRangeMatchesByName();
  TestListContentsValidation();
  TestListContentsMatchesScopeExactly();
  TestUpdateContentsByIdentityAndCount();
  TestCountByStatusIsExact();
  TestUpdateAndDeleteSingleContent();
  TestMakeContentIdentity();

  std::cout << "workledger_unit_content_service: pass\n";
  return 0;
}
