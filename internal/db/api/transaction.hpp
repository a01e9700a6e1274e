#pragma once

namespace ingest::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Transactions on one repository are serialized; never open a
    second transaction on the same thread while one is live

  SQLite: BEGIN IMMEDIATE under the connection mutex
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot copy-on-write under the repository lock
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace ingest::db
