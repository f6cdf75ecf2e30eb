#pragma once

namespace taskorch::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Transactions are serialized against each other; a thread must not
    open a second transaction while it holds one

  SQLite: BEGIN IMMEDIATE under the connection's transaction lock
  Postgres: pqxx::work
  Memory: repository lock + copy-on-write working state
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsCommitted() const = 0;
};

}
