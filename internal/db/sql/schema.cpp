#include "schema.hpp"

namespace workledger::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS requests ("
      " request_id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " scope TEXT NOT NULL,"
      " name TEXT NOT NULL,"
      " requester TEXT NOT NULL DEFAULT '',"
      " request_type INTEGER NOT NULL,"
      " transform_tag TEXT NOT NULL DEFAULT '',"
      " status INTEGER NOT NULL,"
      " locking INTEGER NOT NULL DEFAULT 0,"
      " priority INTEGER NOT NULL DEFAULT 0,"
      " lifetime INTEGER NOT NULL DEFAULT 30,"
      " workload_id INTEGER,"
      " request_metadata TEXT,"
      " processing_metadata TEXT,"
      " lease_generation INTEGER NOT NULL DEFAULT 0,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " locked_at_ms INTEGER,"
      " expired_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS requests_claim_idx ON requests(status, locking, priority DESC, request_id);",
      "CREATE INDEX IF NOT EXISTS requests_workload_idx ON requests(workload_id);",
      "CREATE INDEX IF NOT EXISTS requests_locked_at_idx ON requests(locking, locked_at_ms);",

      "CREATE TABLE IF NOT EXISTS transforms ("
      " transform_id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " transform_type INTEGER NOT NULL,"
      " transform_tag TEXT NOT NULL DEFAULT '',"
      " priority INTEGER NOT NULL DEFAULT 0,"
      " status INTEGER NOT NULL,"
      " retries INTEGER NOT NULL DEFAULT 0,"
      " transform_metadata TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " expired_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS transforms_status_idx ON transforms(status, priority DESC, transform_id);",

      "CREATE TABLE IF NOT EXISTS collections ("
      " coll_id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " transform_id INTEGER NOT NULL REFERENCES transforms(transform_id) ON DELETE CASCADE,"
      " scope TEXT NOT NULL,"
      " name TEXT NOT NULL,"
      " coll_type INTEGER NOT NULL,"
      " status INTEGER NOT NULL,"
      " bytes INTEGER NOT NULL DEFAULT 0,"
      " total_files INTEGER NOT NULL DEFAULT 0,"
      " retries INTEGER NOT NULL DEFAULT 0,"
      " coll_metadata TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " expired_at_ms INTEGER,"
      " UNIQUE(transform_id, scope, name));",

      "CREATE TABLE IF NOT EXISTS contents ("
      " content_id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " coll_id INTEGER NOT NULL REFERENCES collections(coll_id) ON DELETE CASCADE,"
      " scope TEXT NOT NULL,"
      " name TEXT NOT NULL,"
      " min_id INTEGER NOT NULL DEFAULT 0,"
      " max_id INTEGER NOT NULL DEFAULT 0,"
      " content_type INTEGER NOT NULL,"
      " status INTEGER NOT NULL,"
      " bytes INTEGER NOT NULL DEFAULT 0,"
      " md5 TEXT NOT NULL DEFAULT '',"
      " adler32 TEXT NOT NULL DEFAULT '',"
      " processing_id INTEGER,"
      " storage_id INTEGER,"
      " retries INTEGER NOT NULL DEFAULT 0,"
      " path TEXT NOT NULL DEFAULT '',"
      " expired_at_ms INTEGER,"
      " content_metadata TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " UNIQUE(coll_id, scope, name, content_type, min_id, max_id));",
      "CREATE UNIQUE INDEX IF NOT EXISTS contents_file_uq ON contents(coll_id, scope, name) WHERE content_type = 0;",
      "CREATE INDEX IF NOT EXISTS contents_status_idx ON contents(coll_id, status);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS requests ("
      " request_id BIGSERIAL PRIMARY KEY,"
      " scope TEXT NOT NULL,"
      " name TEXT NOT NULL,"
      " requester TEXT NOT NULL DEFAULT '',"
      " request_type INTEGER NOT NULL,"
      " transform_tag TEXT NOT NULL DEFAULT '',"
      " status INTEGER NOT NULL,"
      " locking INTEGER NOT NULL DEFAULT 0,"
      " priority INTEGER NOT NULL DEFAULT 0,"
      " lifetime INTEGER NOT NULL DEFAULT 30,"
      " workload_id BIGINT,"
      " request_metadata JSONB,"
      " processing_metadata JSONB,"
      " lease_generation BIGINT NOT NULL DEFAULT 0,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " locked_at_ms BIGINT,"
      " expired_at_ms BIGINT);",
      "CREATE INDEX IF NOT EXISTS requests_claim_idx ON requests(status, locking, priority DESC, request_id);",
      "CREATE INDEX IF NOT EXISTS requests_workload_idx ON requests(workload_id);",
      "CREATE INDEX IF NOT EXISTS requests_locked_at_idx ON requests(locking, locked_at_ms);",

      "CREATE TABLE IF NOT EXISTS transforms ("
      " transform_id BIGSERIAL PRIMARY KEY,"
      " transform_type INTEGER NOT NULL,"
      " transform_tag TEXT NOT NULL DEFAULT '',"
      " priority INTEGER NOT NULL DEFAULT 0,"
      " status INTEGER NOT NULL,"
      " retries INTEGER NOT NULL DEFAULT 0,"
      " transform_metadata JSONB,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " expired_at_ms BIGINT);",
      "CREATE INDEX IF NOT EXISTS transforms_status_idx ON transforms(status, priority DESC, transform_id);",

      "CREATE TABLE IF NOT EXISTS collections ("
      " coll_id BIGSERIAL PRIMARY KEY,"
      " transform_id BIGINT NOT NULL REFERENCES transforms(transform_id) ON DELETE CASCADE,"
      " scope TEXT NOT NULL,"
      " name TEXT NOT NULL,"
      " coll_type INTEGER NOT NULL,"
      " status INTEGER NOT NULL,"
      " bytes BIGINT NOT NULL DEFAULT 0,"
      " total_files BIGINT NOT NULL DEFAULT 0,"
      " retries INTEGER NOT NULL DEFAULT 0,"
      " coll_metadata JSONB,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " expired_at_ms BIGINT,"
      " UNIQUE(transform_id, scope, name));",

      "CREATE TABLE IF NOT EXISTS contents ("
      " content_id BIGSERIAL PRIMARY KEY,"
      " coll_id BIGINT NOT NULL REFERENCES collections(coll_id) ON DELETE CASCADE,"
      " scope TEXT NOT NULL,"
      " name TEXT NOT NULL,"
      " min_id BIGINT NOT NULL DEFAULT 0,"
      " max_id BIGINT NOT NULL DEFAULT 0,"
      " content_type INTEGER NOT NULL,"
      " status INTEGER NOT NULL,"
      " bytes BIGINT NOT NULL DEFAULT 0,"
      " md5 TEXT NOT NULL DEFAULT '',"
      " adler32 TEXT NOT NULL DEFAULT '',"
      " processing_id BIGINT,"
      " storage_id BIGINT,"
      " retries INTEGER NOT NULL DEFAULT 0,"
      " path TEXT NOT NULL DEFAULT '',"
      " expired_at_ms BIGINT,"
      " content_metadata JSONB,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " UNIQUE(coll_id, scope, name, content_type, min_id, max_id));",
      "CREATE UNIQUE INDEX IF NOT EXISTS contents_file_uq ON contents(coll_id, scope, name) WHERE content_type = 0;",
      "CREATE INDEX IF NOT EXISTS contents_status_idx ON contents(coll_id, status);"};
  return kSchema;
}

} // namespace workledger::db::sql
