#include "sqlite_timeseries_store.hpp"

#include "internal/db/sqlite/sqlite_tx.hpp"

namespace fieldgate::store::sqlite {

using db::ErrorCode;
using db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

SqliteTimeSeriesStore::SqliteTimeSeriesStore(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  Bootstrap(*db_);
}

void SqliteTimeSeriesStore::Bootstrap(db::sqlite::SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS points (measurement TEXT NOT NULL, series_key TEXT NOT NULL, ts_ms INTEGER NOT NULL, payload BLOB NOT NULL, "
          "PRIMARY KEY (measurement, series_key, ts_ms));");
  db.Exec("CREATE INDEX IF NOT EXISTS points_ts ON points(ts_ms);");
}

Result SqliteTimeSeriesStore::Translate(int rc, std::string message) {
  switch (rc) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return Result::Ok();
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, std::move(message));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, std::move(message));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, std::move(message));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, std::move(message));
    default:
      return Result::Err(ErrorCode::InternalError, std::move(message));
  }
}

// ------------------------------------------------------------------
// Write
// ------------------------------------------------------------------

Result SqliteTimeSeriesStore::WriteBatch(const std::vector<fieldgate::v1::Point>& points) {
  if (points.empty()) return Result::Ok();

  std::lock_guard lock(write_mutex_);

  try {
    auto tx = std::make_unique<db::sqlite::SqliteTransaction>(db_);

    auto stmt = db_->Prepare("INSERT INTO points(measurement,series_key,ts_ms,payload) VALUES(?,?,?,?) "
                             "ON CONFLICT(measurement,series_key,ts_ms) DO UPDATE SET payload=excluded.payload;");

    for (const auto& point : points) {
      sqlite3_reset(stmt.get());
      sqlite3_clear_bindings(stmt.get());

      BindText(stmt.get(), 1, point.measurement());
      BindText(stmt.get(), 2, SeriesKey(point));
      BindU64(stmt.get(), 3, util::ToUnixMillis(util::FromProto(point.timestamp())));
      BindBlob(stmt.get(), 4, point.SerializeAsString());

      db_->StepDone(stmt.get(), "insert point");
    }

    stmt.reset();
    tx->Commit();
    return Result::Ok();
  } catch (const db::sqlite::SqliteError& e) {
    // tx destructor rolls back
    return Translate(e.Code(), e.what());
  }
}

// ------------------------------------------------------------------
// Introspection
// ------------------------------------------------------------------

bool SqliteTimeSeriesStore::Healthy() {
  try {
    db_->Exec("SELECT 1;");
    return true;
  } catch (const db::sqlite::SqliteError&) {
    return false;
  }
}

uint64_t SqliteTimeSeriesStore::PointCount() {
  return db_->QueryU64("SELECT COUNT(*) FROM points;");
}

std::optional<util::TimePoint> SqliteTimeSeriesStore::LatestTimestamp() {
  auto stmt = db_->Prepare("SELECT MAX(ts_ms) FROM points;");
  if (sqlite3_step(stmt.get()) != SQLITE_ROW || sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL) {
    return std::nullopt;
  }
  return util::FromUnixMillis(static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0)));
}

} // namespace fieldgate::store::sqlite
