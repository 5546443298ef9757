#pragma once

namespace provgate::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Appends are invisible to other readers until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Memory: write set applied under the log mutex
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

}
