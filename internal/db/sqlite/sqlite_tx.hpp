#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace fieldgate::db::sqlite {

// BEGIN IMMEDIATE on construction, so the write lock is held from the first
// statement. ROLLBACK on destruction unless committed.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return done_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      done_ = false;
};

} // namespace fieldgate::db::sqlite
