#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace fieldgate::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// Carries the sqlite primary result code so stores can map it to db::ErrorCode.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int rc, const std::string& what) : std::runtime_error(what), rc_(rc) {}

  int Code() const {
    return rc_;
  }

 private:
  int rc_;
};

/*
  One sqlite file: the point store or the overflow queue.

  The handle is opened in serialized (FULLMUTEX) mode, but transactions are
  per connection: callers that share one SqliteDB across threads must not
  interleave BEGIN/COMMIT pairs.
*/
class SqliteDB {
 public:
  enum class Sync { kNormal, kFull };

  explicit SqliteDB(std::string path, Sync sync = Sync::kNormal, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // DDL, pragmas and statements without bindings
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Steps a bound INSERT/UPDATE/DELETE; throws SqliteError unless SQLITE_DONE.
  void StepDone(sqlite3_stmt* stmt, const char* what);

  // true on SQLITE_ROW, false on SQLITE_DONE; throws SqliteError otherwise.
  bool StepRow(sqlite3_stmt* stmt, const char* what);

  // First column of the first row, 0 when NULL or no row.
  uint64_t QueryU64(const std::string& sql);

 private:
  void Configure(Sync sync, std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace fieldgate::db::sqlite
