#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace fieldgate::db::postgres {

// pqxx::work on a pooled connection; statement_timeout is scoped to the transaction.
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds statement_timeout);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return done_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              done_ = false;
};

} // namespace fieldgate::db::postgres
