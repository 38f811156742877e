#pragma once

namespace workledger::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in the SQLite-compatible subset with '?' placeholders
  so they work in both engines (postgres rewrites them to $n).
  No trailing ';' : the postgres driver appends RETURNING to inserts.

  Column order of the *_COLUMNS lists is what the row readers in
  sql_repository.cpp index into.
*/

// requests

static constexpr const char* REQUEST_COLUMNS =
    "request_id,scope,name,requester,request_type,transform_tag,status,locking,"
    "priority,lifetime,workload_id,request_metadata,processing_metadata,"
    "lease_generation,created_at_ms,updated_at_ms,locked_at_ms,expired_at_ms";

static constexpr const char* INSERT_REQUEST =
    "INSERT INTO requests(scope,name,requester,request_type,transform_tag,status,locking,"
    "priority,lifetime,workload_id,request_metadata,processing_metadata,"
    "lease_generation,created_at_ms,updated_at_ms,locked_at_ms,expired_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)";

static constexpr const char* LOCK_REQUEST =
    "UPDATE requests SET locking=1,locked_at_ms=?,updated_at_ms=?,"
    "lease_generation=lease_generation+1"
    " WHERE request_id=? AND locking=0";

static constexpr const char* RELEASE_EXPIRED_LOCKS =
    "UPDATE requests SET locking=0,locked_at_ms=NULL,updated_at_ms=?"
    " WHERE locking=1 AND locked_at_ms<?";

static constexpr const char* DELETE_REQUEST =
    "DELETE FROM requests WHERE request_id=?";

// transforms

static constexpr const char* TRANSFORM_COLUMNS =
    "transform_id,transform_type,transform_tag,priority,status,retries,"
    "transform_metadata,created_at_ms,updated_at_ms,expired_at_ms";

static constexpr const char* INSERT_TRANSFORM =
    "INSERT INTO transforms(transform_type,transform_tag,priority,status,retries,"
    "transform_metadata,created_at_ms,updated_at_ms,expired_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?)";

static constexpr const char* DELETE_TRANSFORM =
    "DELETE FROM transforms WHERE transform_id=?";

// collections

static constexpr const char* COLLECTION_COLUMNS =
    "coll_id,transform_id,scope,name,coll_type,status,bytes,total_files,retries,"
    "coll_metadata,created_at_ms,updated_at_ms,expired_at_ms";

static constexpr const char* INSERT_COLLECTION =
    "INSERT INTO collections(transform_id,scope,name,coll_type,status,bytes,total_files,"
    "retries,coll_metadata,created_at_ms,updated_at_ms,expired_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?)";

static constexpr const char* DELETE_COLLECTION =
    "DELETE FROM collections WHERE coll_id=?";

// contents

static constexpr const char* CONTENT_COLUMNS =
    "content_id,coll_id,scope,name,min_id,max_id,content_type,status,bytes,md5,"
    "adler32,processing_id,storage_id,retries,path,expired_at_ms,content_metadata,"
    "created_at_ms,updated_at_ms";

// Batched: each backend appends its own VALUES list.
static constexpr const char* INSERT_CONTENT_PREFIX =
    "INSERT INTO contents(coll_id,scope,name,min_id,max_id,content_type,status,bytes,"
    "md5,adler32,processing_id,storage_id,retries,path,expired_at_ms,content_metadata,"
    "created_at_ms,updated_at_ms)";

static constexpr int INSERT_CONTENT_ARITY = 18;

static constexpr const char* DELETE_CONTENT =
    "DELETE FROM contents WHERE content_id=?";

static constexpr const char* COUNT_CONTENTS_BY_STATUS =
    "SELECT status,COUNT(*) FROM contents GROUP BY status";

static constexpr const char* COUNT_COLLECTION_CONTENTS_BY_STATUS =
    "SELECT status,COUNT(*) FROM contents WHERE coll_id=? GROUP BY status";

}
