#pragma once

namespace fieldgate::db {

// A point batch or an overflow enqueue lands whole or not at all.
// Implementations roll back in the destructor when Commit() was not reached.
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

} // namespace fieldgate::db
