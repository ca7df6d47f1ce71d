#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace fieldgate::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (done_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    FIELDGATE_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  done_ = true;
}

void SqliteTransaction::Rollback() {
  done_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace fieldgate::db::sqlite
