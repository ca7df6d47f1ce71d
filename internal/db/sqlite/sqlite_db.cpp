#include "sqlite_db.hpp"

namespace fieldgate::db::sqlite {

namespace {

[[noreturn]] void Fail(int rc, sqlite3* db, const std::string& what) {
  throw SqliteError(rc & 0xff, what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
}

} // namespace

SqliteDB::SqliteDB(std::string path, Sync sync, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc & 0xff, "open " + path_ + ": " + msg);
  }

  try {
    Configure(sync, busy_timeout);
  } catch (const SqliteError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw SqliteError(rc & 0xff, msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  const int     rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) Fail(rc, db_, "prepare");
  return Statement(stmt);
}

void SqliteDB::StepDone(sqlite3_stmt* stmt, const char* what) {
  const int rc = sqlite3_step(stmt);
  if (rc != SQLITE_DONE) Fail(rc, db_, what);
}

bool SqliteDB::StepRow(sqlite3_stmt* stmt, const char* what) {
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  Fail(rc, db_, what);
}

uint64_t SqliteDB::QueryU64(const std::string& sql) {
  auto      stmt = Prepare(sql);
  const int rc   = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) return 0;
  if (rc != SQLITE_ROW) Fail(rc, db_, "query");
  return static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
}

void SqliteDB::Configure(Sync sync, std::chrono::milliseconds busy_timeout) {
  Exec("PRAGMA journal_mode=WAL;");

  // the overflow queue fsyncs every commit
  Exec(sync == Sync::kFull ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");

  const int rc = sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
  if (rc != SQLITE_OK) Fail(rc, db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace fieldgate::db::sqlite
