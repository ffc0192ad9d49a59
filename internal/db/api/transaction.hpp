#pragma once

namespace meshdispatch::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - At most one transaction is open per repository at a time; Begin()
    blocks until the current one ends. Never open a second transaction
    on the same thread.

  SQLite: process mutex + BEGIN IMMEDIATE
  Memory: process mutex + snapshot copy
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
