#include <atomic>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lease/lease_engine.hpp"
#include "internal/service/request_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if WORKLEDGER_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using namespace workledger::v1;
using workledger::db::model::RequestRecord;
using workledger::lease::ClaimOptions;
using workledger::lease::LeaseEngine;

constexpr uint64_t kStartMs = 1'700'000'000'000;

struct Fixture {
  std::shared_ptr<std::atomic<uint64_t>>  clock = std::make_shared<std::atomic<uint64_t>>(kStartMs);
  std::shared_ptr<workledger::db::Repository> repository;
  workledger::util::NowFn                 now;

  explicit Fixture(std::shared_ptr<workledger::db::Repository> repo = std::make_shared<workledger::db::memory::MemoryRepository>())
      : repository(std::move(repo)) {
    now = [clock = clock] { return workledger::util::FromUnixMillis(clock->load()); };
  }

  uint64_t Add(const std::string& name, RequestStatus status = REQUEST_STATUS_NEW, int32_t priority = 0) {
    workledger::service::ServiceContext ctx;
    ctx.repository = repository;
    ctx.now        = now;

    RequestRecord request;
    request.scope    = "data18";
    request.name     = name;
    request.status   = status;
    request.priority = priority;
    return workledger::service::RequestService(ctx).AddRequest(request);
  }

  RequestRecord Get(uint64_t id) const {
    workledger::service::ServiceContext ctx;
    ctx.repository = repository;
    return workledger::service::RequestService(ctx).GetRequest(id);
  }

  LeaseEngine Engine() const {
    return LeaseEngine(repository, now);
  }
};

ClaimOptions LockingClaim(std::size_t bulk_size = 10) {
  ClaimOptions options;
  options.statuses  = {REQUEST_STATUS_NEW, REQUEST_STATUS_READY};
  options.lock      = true;
  options.bulk_size = bulk_size;
  return options;
}

void TestClaimLocksAndSecondClaimIsEmpty() {
  Fixture f;
  const auto id = f.Add("claim");

  auto engine = f.Engine();
  f.clock->fetch_add(1000);
  const auto claimed = engine.Claim(LockingClaim());
  assert(claimed.size() == 1);
  assert(claimed[0].request_id == id);
  assert(claimed[0].locking == REQUEST_LOCKING_IDLE);
  assert(workledger::lease::FencingToken(claimed[0]) == 1);

  const auto stored = f.Get(id);
  assert(stored.locking == REQUEST_LOCKING_LOCKING);
  assert(stored.lease_generation == 1);
  assert(stored.locked_at_ms == kStartMs + 1000);
  assert(stored.updated_at_ms == kStartMs + 1000);

  assert(engine.Claim(LockingClaim()).empty());
}

void TestClaimOrdersByPriorityAndHonorsBulkSize() {
  Fixture f;
  const auto low  = f.Add("low", REQUEST_STATUS_NEW, 1);
  const auto high = f.Add("high", REQUEST_STATUS_READY, 9);
  const auto mid  = f.Add("mid", REQUEST_STATUS_NEW, 5);
  (void)f.Add("finished", REQUEST_STATUS_FINISHED, 100);

  auto       engine = f.Engine();
  const auto first  = engine.Claim(LockingClaim(2));
  assert(first.size() == 2);
  assert(first[0].request_id == high);
  assert(first[1].request_id == mid);

  const auto second = engine.Claim(LockingClaim(2));
  assert(second.size() == 1);
  assert(second[0].request_id == low);
}

void TestTimePeriodFiltersRecentlyUpdated() {
  Fixture f;
  const auto old_id = f.Add("old");
  f.clock->fetch_add(50'000);
  (void)f.Add("recent");
  f.clock->fetch_add(20'000);

  auto options            = LockingClaim();
  options.time_period_sec = 60;

  const auto claimed = f.Engine().Claim(options);
  assert(claimed.size() == 1);
  assert(claimed[0].request_id == old_id);
}

void TestNonLockingClaimChangesNothing() {
  Fixture f;
  const auto id = f.Add("peek");

  auto options = LockingClaim();
  options.lock = false;

  auto engine = f.Engine();
  assert(engine.Claim(options).size() == 1);
  assert(engine.Claim(options).size() == 1);

  const auto stored = f.Get(id);
  assert(stored.locking == REQUEST_LOCKING_IDLE);
  assert(stored.lease_generation == 0);
  assert(stored.updated_at_ms == kStartMs);
}

void TestReclaimResetsOnlyExpiredLeases() {
  Fixture f;
  const auto stale = f.Add("stale");
  auto       engine = f.Engine();
  assert(engine.Claim(LockingClaim()).size() == 1);

  f.clock->fetch_add(30'000);
  const auto fresh = f.Add("fresh");
  assert(engine.Claim(LockingClaim()).size() == 1);

  f.clock->fetch_add(40'000);
  assert(engine.ReclaimExpiredLocks(60) == 1);

  const auto stale_row = f.Get(stale);
  assert(stale_row.locking == REQUEST_LOCKING_IDLE);
  assert(!stale_row.locked_at_ms.has_value());
  assert(stale_row.lease_generation == 1);
  assert(f.Get(fresh).locking == REQUEST_LOCKING_LOCKING);

  assert(engine.ReclaimExpiredLocks(60) == 0);

  const auto again = engine.Claim(LockingClaim());
  assert(again.size() == 1);
  assert(again[0].request_id == stale);
  assert(workledger::lease::FencingToken(again[0]) == 2);
}

void TestHugePeriodsDoNotWrapAround() {
  assert(workledger::util::SecondsToMillis(18446744073709552ull) == UINT64_MAX);
  assert(workledger::util::DaysToMillis(UINT64_MAX / 1000) == UINT64_MAX);
  assert(workledger::util::AddMillis(kStartMs, UINT64_MAX) == UINT64_MAX);

  Fixture f;
  const auto locked = f.Add("locked");
  auto       engine = f.Engine();
  assert(engine.Claim(LockingClaim()).size() == 1);

  f.clock->fetch_add(1000);
  assert(engine.ReclaimExpiredLocks(18446744073709552ull) == 0);
  assert(engine.ReclaimExpiredLocks(UINT64_MAX) == 0);
  assert(f.Get(locked).locking == REQUEST_LOCKING_LOCKING);

  (void)f.Add("idle");
  f.clock->fetch_add(1000);
  auto options            = LockingClaim();
  options.time_period_sec = 18446744073709552ull;
  assert(engine.Claim(options).empty());
}

void TestClaimRejectsMalformedOptions() {
  Fixture f;
  auto    engine = f.Engine();

  bool threw = false;
  try {
    (void)engine.Claim(ClaimOptions{});
  } catch (const workledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)engine.Claim(LockingClaim(0));
  } catch (const workledger::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

// Every worker retries retryable failures; no request may be claimed twice.
void RunConcurrentClaims(const std::vector<std::shared_ptr<workledger::db::Repository>>& repositories, std::size_t expected) {
  std::mutex         mutex;
  std::set<uint64_t> seen;
  std::size_t        total = 0;

  std::vector<std::thread> workers;
  for (const auto& repository : repositories) {
    workers.emplace_back([&, repository] {
      LeaseEngine engine(repository);
      int         empty_rounds = 0;
      while (empty_rounds < 3) {
        std::vector<RequestRecord> claimed;
        try {
          claimed = engine.Claim(LockingClaim(3));
        } catch (const workledger::util::BackendFailure&) {
          continue;
        }
        if (claimed.empty()) {
          ++empty_rounds;
          continue;
        }
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& request : claimed) {
          const bool first_claim = seen.insert(request.request_id).second;
          assert(first_claim);
          ++total;
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(total == expected);
  assert(seen.size() == expected);
}

void TestConcurrentClaimsOnMemoryRepository() {
  Fixture f;
  for (int i = 0; i < 40; ++i) {
    (void)f.Add("mem." + std::to_string(i));
  }
  RunConcurrentClaims({f.repository, f.repository, f.repository, f.repository}, 40);
}

#if WORKLEDGER_DB_SQLITE
void TestConcurrentClaimsAcrossSqliteConnections() {
  const auto dir = std::filesystem::temp_directory_path() / "workledger_lease_engine_tests";
  std::filesystem::create_directories(dir);
  const auto path = (dir / "claims.db").string();
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");

  std::vector<std::shared_ptr<workledger::db::Repository>> repositories;
  for (int i = 0; i < 4; ++i) {
    auto db = std::make_shared<workledger::db::sqlite::SqliteDB>(path);
    if (i == 0) {
      workledger::db::sql::RunMigrations(*db, workledger::db::sql::SqliteSchema());
    }
    repositories.push_back(std::make_shared<workledger::db::sqlite::SqliteRepository>(db));
  }

  Fixture f(repositories.front());
  for (int i = 0; i < 30; ++i) {
    (void)f.Add("sqlite." + std::to_string(i));
  }
  RunConcurrentClaims(repositories, 30);
}
#endif

} // namespace

int main() {
  TestClaimLocksAndSecondClaimIsEmpty();
  TestClaimOrdersByPriorityAndHonorsBulkSize();
  TestTimePeriodFiltersRecentlyUpdated();
  TestNonLockingClaimChangesNothing();
  TestReclaimResetsOnlyExpiredLeases();
  TestHugePeriodsDoNotWrapAround();
  TestClaimRejectsMalformedOptions();
  TestConcurrentClaimsOnMemoryRepository();
#if WORKLEDGER_DB_SQLITE
  TestConcurrentClaimsAcrossSqliteConnections();
#endif

  std::cout << "workledger_unit_lease_engine: pass\n";
  return 0;
}
