#pragma once

namespace seawatch::db {

/*
  Unit of work against an IncidentStore.

  A merge writes the primary's patch and the secondary's merged_into
  link through the same Transaction, so both land or neither does.

  - Begin() returns an open transaction; reads inside it see its own writes
  - Commit() publishes every write or throws (WriteConflict, StoreUnavailable)
  - Rollback() and the destructor of an uncommitted transaction discard writes

  Backends:
    Memory    whole-state snapshot, version checked at commit
    SQLite    BEGIN IMMEDIATE on the shared connection
    Postgres  pqxx::work on a pooled connection
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace seawatch::db
