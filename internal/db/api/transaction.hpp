#pragma once

namespace healthd::db {

/*
  Abstract transaction.

  - Changes are invisible to other connections until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE, holding the connection's write lock
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() completed
  virtual bool IsFinished() const = 0;
};

}
