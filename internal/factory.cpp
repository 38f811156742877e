#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/transform_committer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/lease/lease_engine.hpp"
#include "internal/lease/lock_sweeper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/collection_service.hpp"
#include "internal/service/content_service.hpp"
#include "internal/service/progress_service.hpp"
#include "internal/service/request_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transform_service.hpp"
#if WORKLEDGER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if WORKLEDGER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace workledger::factory {

namespace {

#if WORKLEDGER_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ApplyStatement(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const workledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WORKLEDGER_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = sqlite.busy_timeout_ms() ? std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), static_cast<int>(sqlite.busy_timeout_ms()))
                                              : std::make_shared<db::sqlite::SqliteDB>(sqlite.path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    WORKLEDGER_LOG_INFO("sqlite backend ready", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if WORKLEDGER_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = postgres.max_connections()
                               ? std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections())
                               : std::make_shared<db::postgres::PgPool>(postgres.connection_uri());
    BootstrapPostgresSchema(pool);
    WORKLEDGER_LOG_INFO("postgres backend ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  WORKLEDGER_LOG_INFO("memory backend ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const workledger::runtime::config::RuntimeConfig& config, util::NowFn now) {
  Application app;
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository        = app.repository;
  ctx.now               = now;
  ctx.content_bulk_size = workledger::config::ContentBulkSize(config);

  app.requests    = std::make_shared<service::RequestService>(ctx);
  app.transforms  = std::make_shared<service::TransformService>(ctx);
  app.collections = std::make_shared<service::CollectionService>(ctx);
  app.contents    = std::make_shared<service::ContentService>(ctx);
  app.progress    = std::make_shared<service::ProgressService>(ctx);

  // ------------------------------------------------------------------
  // Leases and commit
  // ------------------------------------------------------------------
  app.leases    = std::make_shared<lease::LeaseEngine>(app.repository, now);
  app.committer = std::make_shared<core::TransformCommitter>(app.repository, now);
  app.sweeper   = std::make_shared<lease::LockSweeper>(app.leases, workledger::config::LockTimeoutSec(config),
                                                     std::chrono::seconds(workledger::config::SweepIntervalSec(config)));

  return app;
}

} // namespace workledger::factory
