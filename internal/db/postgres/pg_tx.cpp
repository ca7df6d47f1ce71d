#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace fieldgate::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds statement_timeout) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
  if (statement_timeout.count() > 0) {
    tx_->exec("SET LOCAL statement_timeout = " + std::to_string(statement_timeout.count()));
  }
}

PgTransaction::~PgTransaction() {
  if (done_) return;
  try {
    tx_->abort();
  } catch (const pqxx::failure& e) {
    FIELDGATE_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  done_ = true;
}

void PgTransaction::Rollback() {
  done_ = true;
  tx_->abort();
}

} // namespace fieldgate::db::postgres
