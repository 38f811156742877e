#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/transform_committer.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lease/lease_engine.hpp"
#include "internal/service/collection_service.hpp"
#include "internal/service/request_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transform_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/metadata.hpp"
#include "internal/util/time.hpp"

#if WORKLEDGER_DB_SQLITE
#include <filesystem>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using namespace workledger::v1;
using workledger::core::CollectionSet;
using workledger::core::TransformCommitter;
using workledger::core::TransformExtension;
using workledger::core::TransformToAdd;
using workledger::db::model::CollectionRecord;
using workledger::db::model::RequestUpdate;

struct Fixture {
  std::shared_ptr<workledger::db::Repository> repository;
  workledger::service::ServiceContext         ctx;
  uint64_t                                    request_id = 0;

  explicit Fixture(std::shared_ptr<workledger::db::Repository> repo = std::make_shared<workledger::db::memory::MemoryRepository>())
      : repository(std::move(repo)) {
    ctx.repository = repository;

    workledger::db::model::RequestRecord request;
    request.scope = "data18";
    request.name  = "commit";
    request_id    = Requests().AddRequest(request);
  }

  workledger::service::RequestService Requests() const {
    return workledger::service::RequestService(ctx);
  }
  workledger::service::TransformService Transforms() const {
    return workledger::service::TransformService(ctx);
  }
  workledger::service::CollectionService Collections() const {
    return workledger::service::CollectionService(ctx);
  }

  std::size_t TransformCount() const {
    return Transforms().ListTransforms({}).size();
  }
  std::size_t CollectionCount() const {
    return Collections().ListCollections({}).size();
  }
};

CollectionRecord Coll(const std::string& name) {
  CollectionRecord collection;
  collection.scope = "data18";
  collection.name  = name;
  return collection;
}

TransformToAdd MakeTransform(const std::string& tag, std::optional<int64_t> workload_id = std::nullopt) {
  TransformToAdd item;
  item.transform.transform_tag = tag;
  if (workload_id) {
    item.transform.transform_metadata.emplace();
    workledger::util::SetInt(*item.transform.transform_metadata, "workload_id", *workload_id);
  }
  CollectionSet collections;
  collections.input_collections  = {Coll(tag + ".in")};
  collections.output_collections = {Coll(tag + ".out")};
  collections.log_collections    = {Coll(tag + ".log")};
  item.collections               = collections;
  return item;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCommitWritesHierarchyAndCrossReferences() {
  Fixture            f;
  TransformCommitter committer(f.repository);

  RequestUpdate update;
  update.status = REQUEST_STATUS_TRANSFORMING;

  const auto committed = committer.CommitTransforms(f.request_id, update, {MakeTransform("t1", 4242), MakeTransform("t2")}, {});
  assert(committed.size() == 2);

  const auto& first = committed[0];
  assert(first.input_coll_ids.size() == 1);
  assert(first.output_coll_ids.size() == 1);
  assert(first.log_coll_ids.size() == 1);

  const auto transform = f.Transforms().GetTransform(first.transform_id);
  assert(transform.transform_metadata.has_value());
  assert(workledger::util::GetInt(*transform.transform_metadata, "request_id") == static_cast<int64_t>(f.request_id));

  const auto output = f.Collections().GetCollection(first.output_coll_ids[0]);
  assert(output.transform_id == first.transform_id);
  assert(output.coll_metadata.has_value());
  const auto& metadata = *output.coll_metadata;
  assert(workledger::util::GetInt(metadata, "transform_id") == static_cast<int64_t>(first.transform_id));
  assert(workledger::util::GetInt(metadata, "workload_id") == 4242);
  assert((workledger::util::GetIntList(metadata, "input_collections") ==
          std::vector<int64_t>{static_cast<int64_t>(first.input_coll_ids[0])}));
  assert((workledger::util::GetIntList(metadata, "log_collections") ==
          std::vector<int64_t>{static_cast<int64_t>(first.log_coll_ids[0])}));

  const auto second_output = f.Collections().GetCollection(committed[1].output_coll_ids[0]);
  assert(!workledger::util::GetInt(*second_output.coll_metadata, "workload_id").has_value());

  assert(f.Collections().GetCollection(first.input_coll_ids[0]).transform_id == first.transform_id);
  assert(f.Requests().GetRequest(f.request_id).status == REQUEST_STATUS_TRANSFORMING);
  assert(f.TransformCount() == 2);
  assert(f.CollectionCount() == 6);
}

void TestValidationFailureWritesNothing() {
  Fixture            f;
  TransformCommitter committer(f.repository);

  auto no_collections        = MakeTransform("bare");
  no_collections.collections = std::nullopt;
  assert(Throws<workledger::util::InvalidArgument>(
      [&] { (void)committer.CommitTransforms(f.request_id, {}, {MakeTransform("ok"), no_collections}, {}); }));

  auto empty_set        = MakeTransform("empty");
  empty_set.collections = CollectionSet{};
  assert(Throws<workledger::util::InvalidArgument>([&] { (void)committer.CommitTransforms(f.request_id, {}, {empty_set}, {}); }));

  auto unnamed = MakeTransform("unnamed");
  unnamed.collections->log_collections[0].name.clear();
  assert(Throws<workledger::util::InvalidArgument>([&] { (void)committer.CommitTransforms(f.request_id, {}, {unnamed}, {}); }));

  auto huge_workload = MakeTransform("huge");
  huge_workload.transform.transform_metadata = workledger::util::DecodeMetadata(R"({"workload_id":1e30})");
  assert(Throws<workledger::util::InvalidArgument>([&] { (void)committer.CommitTransforms(f.request_id, {}, {huge_workload}, {}); }));

  assert(f.TransformCount() == 0);
  assert(f.CollectionCount() == 0);
}

void TestDuplicateCollectionRollsBackEverything(std::shared_ptr<workledger::db::Repository> repository) {
  Fixture            f(std::move(repository));
  TransformCommitter committer(f.repository);

  auto clash = MakeTransform("clash");
  clash.collections->output_collections.push_back(Coll("clash.out"));

  RequestUpdate update;
  update.status = REQUEST_STATUS_TRANSFORMING;
  assert(Throws<workledger::util::Duplicate>(
      [&] { (void)committer.CommitTransforms(f.request_id, update, {MakeTransform("fine"), clash}, {}); }));

  assert(f.TransformCount() == 0);
  assert(f.CollectionCount() == 0);
  assert(f.Requests().GetRequest(f.request_id).status == REQUEST_STATUS_NEW);
}

void TestMissingTargetsRollBack(std::shared_ptr<workledger::db::Repository> repository) {
  Fixture            f(std::move(repository));
  TransformCommitter committer(f.repository);

  TransformExtension missing;
  missing.transform_id = 999;
  missing.update.status = TRANSFORM_STATUS_EXTEND;
  assert(Throws<workledger::util::NotFound>(
      [&] { (void)committer.CommitTransforms(f.request_id, {}, {MakeTransform("ext")}, {missing}); }));
  assert(f.TransformCount() == 0);

  assert(Throws<workledger::util::NotFound>(
      [&] { (void)committer.CommitTransforms(f.request_id + 50, {}, {MakeTransform("orphan")}, {}); }));
  assert(f.TransformCount() == 0);
  assert(f.CollectionCount() == 0);
}

void TestExtensionUpdatesExistingTransform() {
  Fixture            f;
  TransformCommitter committer(f.repository);

  const auto first = committer.CommitTransforms(f.request_id, {}, {MakeTransform("base")}, {});

  TransformExtension extension;
  extension.transform_id    = first[0].transform_id;
  extension.update.status   = TRANSFORM_STATUS_EXTEND;
  extension.update.priority = 3;
  assert(committer.CommitTransforms(f.request_id, {}, {}, {extension}).empty());

  const auto transform = f.Transforms().GetTransform(first[0].transform_id);
  assert(transform.status == TRANSFORM_STATUS_EXTEND);
  assert(transform.priority == 3);
}

void TestFencedCommitReleasesLease() {
  Fixture                       f;
  TransformCommitter            committer(f.repository);
  workledger::lease::LeaseEngine engine(f.repository);

  workledger::lease::ClaimOptions options;
  options.statuses = {REQUEST_STATUS_NEW};
  options.lock     = true;
  const auto claimed = engine.Claim(options);
  assert(claimed.size() == 1);
  const auto token = workledger::lease::FencingToken(claimed[0]);

  RequestUpdate update;
  update.status = REQUEST_STATUS_TRANSFORMING;
  (void)committer.CommitTransforms(f.request_id, update, {MakeTransform("fenced")}, {}, token);

  const auto stored = f.Requests().GetRequest(f.request_id);
  assert(stored.status == REQUEST_STATUS_TRANSFORMING);
  assert(stored.locking == REQUEST_LOCKING_IDLE);
  assert(stored.lease_generation == token);

  // The lease is gone, so the same token no longer fences anything.
  assert(Throws<workledger::util::LeaseConflict>(
      [&] { (void)committer.CommitTransforms(f.request_id, update, {MakeTransform("late")}, {}, token); }));
  assert(f.TransformCount() == 1);
}

void TestStaleTokenAfterReclaimIsRejected() {
  Fixture            f;
  TransformCommitter committer(f.repository);

  auto                           clock = std::make_shared<std::atomic<uint64_t>>(1'700'000'000'000);
  workledger::lease::LeaseEngine engine(f.repository, [clock] { return workledger::util::FromUnixMillis(clock->load()); });

  workledger::lease::ClaimOptions options;
  options.statuses = {REQUEST_STATUS_NEW};
  options.lock     = true;

  const auto stale_token = workledger::lease::FencingToken(engine.Claim(options).at(0));
  clock->fetch_add(5000);
  assert(engine.ReclaimExpiredLocks(1) == 1);
  const auto fresh_token = workledger::lease::FencingToken(engine.Claim(options).at(0));
  assert(fresh_token == stale_token + 1);

  assert(Throws<workledger::util::LeaseConflict>(
      [&] { (void)committer.CommitTransforms(f.request_id, {}, {MakeTransform("stale")}, {}, stale_token); }));
  assert(f.TransformCount() == 0);

  (void)committer.CommitTransforms(f.request_id, {}, {MakeTransform("fresh")}, {}, fresh_token);
  assert(f.TransformCount() == 1);
}

std::shared_ptr<workledger::db::Repository> MemoryLedger() {
  return std::make_shared<workledger::db::memory::MemoryRepository>();
}

#if WORKLEDGER_DB_SQLITE
// Fresh database file per call.
std::shared_ptr<workledger::db::Repository> SqliteLedger(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "workledger_transform_committer_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / (name + ".db")).string();
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");

  auto db = std::make_shared<workledger::db::sqlite::SqliteDB>(path);
  workledger::db::sql::RunMigrations(*db, workledger::db::sql::SqliteSchema());
  return std::make_shared<workledger::db::sqlite::SqliteRepository>(std::move(db));
}
#endif

} // namespace

int main() {
  TestCommitWritesHierarchyAndCrossReferences();
  TestValidationFailureWritesNothing();
  TestDuplicateCollectionRollsBackEverything(MemoryLedger());
  TestMissingTargetsRollBack(MemoryLedger());
#if WORKLEDGER_DB_SQLITE
  TestDuplicateCollectionRollsBackEverything(SqliteLedger("duplicate_collection"));
  TestMissingTargetsRollBack(SqliteLedger("missing_targets"));
#endif
  TestExtensionUpdatesExistingTransform();
  TestFencedCommitReleasesLease();
  TestStaleTokenAfterReclaimIsRejected();

  std::cout << "workledger_unit_transform_committer: pass\n";
  return 0;
}
