#pragma once

namespace workledger::db {

/*
  Unit of work handed to every Repository statement.

  A claim, a hierarchical commit and a bulk content insert each run inside
  exactly one Transaction; nothing they write is visible to other workers
  before Commit(), and a Transaction destroyed without Commit() rolls back.

  How each backend isolates concurrent claimers:
    sqlite    BEGIN IMMEDIATE takes the write lock up front (Busy on timeout)
    postgres  pqxx::work, candidate rows read FOR UPDATE SKIP LOCKED
    memory    private snapshot; a writing Commit() fails with
              SerializationFailure if another writer committed first

  Begin (the backend's Repository::Begin) and Commit() report failure by
  throwing db::BackendError.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace workledger::db
