#include "overflow_cache.hpp"

#include <filesystem>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldgate::overflow {

using observability::IntField;
using observability::StringField;

namespace {

std::shared_ptr<db::sqlite::SqliteDB> OpenDb(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  return std::make_shared<db::sqlite::SqliteDB>(path, db::sqlite::SqliteDB::Sync::kFull);
}

std::string DeviceOf(const fieldgate::v1::Point& point) {
  auto it = point.tags().find("device_id");
  return it == point.tags().end() ? std::string() : it->second;
}

std::string SeqList(const auto& records) {
  std::string list;
  for (const auto& r : records) {
    if (!list.empty()) list += ",";
    list += std::to_string(r.seq);
  }
  return list;
}

} // namespace

OverflowCache::OverflowCache(const std::string& path, uint64_t capacity) : db_(OpenDb(path)), capacity_(capacity) {
  if (capacity_ == 0) throw util::InvalidConfig("overflow capacity must be > 0");
  Bootstrap();

  auto depth = Depth();
  if (depth > 0) {
    FIELDGATE_LOG_INFO("overflow cache recovered pending records", {StringField("path", path), IntField("depth", static_cast<int64_t>(depth))});
  }
}

void OverflowCache::Bootstrap() {
  std::lock_guard lock(mutex_);
  db_->Exec("CREATE TABLE IF NOT EXISTS overflow (seq INTEGER PRIMARY KEY AUTOINCREMENT, device_id TEXT NOT NULL, payload BLOB NOT NULL, "
            "enqueued_at_ms INTEGER NOT NULL, attempts INTEGER NOT NULL DEFAULT 0);");
}

// ------------------------------------------------------------------
// Enqueue / evict
// ------------------------------------------------------------------

uint64_t OverflowCache::Enqueue(const std::vector<fieldgate::v1::Point>& points, util::TimePoint now) {
  if (points.empty()) return 0;

  uint64_t evicted = 0;
  {
    std::lock_guard lock(mutex_);
    db::sqlite::SqliteTransaction tx(db_);

    auto insert = db_->Prepare("INSERT INTO overflow(device_id, payload, enqueued_at_ms, attempts) VALUES(?,?,?,0);");
    const auto now_ms = static_cast<sqlite3_int64>(util::ToUnixMillis(now));

    for (const auto& point : points) {
      const auto device  = DeviceOf(point);
      const auto payload = point.SerializeAsString();

      sqlite3_reset(insert.get());
      sqlite3_bind_text(insert.get(), 1, device.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_blob(insert.get(), 2, payload.data(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
      sqlite3_bind_int64(insert.get(), 3, now_ms);

      db_->StepDone(insert.get(), "overflow insert");
    }
    insert.reset();

    const auto depth = db_->QueryU64("SELECT COUNT(*) FROM overflow;");

    if (depth > capacity_) {
      evicted    = depth - capacity_;
      auto evict = db_->Prepare("DELETE FROM overflow WHERE seq IN (SELECT seq FROM overflow ORDER BY seq LIMIT ?);");
      sqlite3_bind_int64(evict.get(), 1, static_cast<sqlite3_int64>(evicted));
      db_->StepDone(evict.get(), "overflow evict");
    }

    tx.Commit();
  }

  if (evicted > 0) {
    evicted_ += evicted;
    FIELDGATE_LOG_ERROR("overflow cache full, oldest records evicted",
                        {IntField("evicted", static_cast<int64_t>(evicted)), IntField("capacity", static_cast<int64_t>(capacity_)),
                         IntField("evicted_total", static_cast<int64_t>(evicted_.load()))});
  }

  FIELDGATE_LOG_WARN("points moved to overflow cache", {IntField("points", static_cast<int64_t>(points.size()))});
  return evicted;
}

// ------------------------------------------------------------------
// Replay
// ------------------------------------------------------------------

std::vector<OverflowCache::Record> OverflowCache::Oldest(uint32_t limit) const {
  std::lock_guard lock(mutex_);

  std::vector<Record> out;
  std::vector<Record> corrupt;
  {
    auto stmt = db_->Prepare("SELECT seq, payload FROM overflow ORDER BY seq LIMIT ?;");
    sqlite3_bind_int64(stmt.get(), 1, limit);

    while (db_->StepRow(stmt.get(), "overflow read")) {
      Record r;
      r.seq = sqlite3_column_int64(stmt.get(), 0);

      const auto* blob = sqlite3_column_blob(stmt.get(), 1);
      const int   size = sqlite3_column_bytes(stmt.get(), 1);
      if (!r.point.ParseFromArray(blob, size)) {
        corrupt.push_back(std::move(r));
        continue;
      }
      out.push_back(std::move(r));
    }
  }

  // unparseable rows are dropped and counted as evicted
  if (!corrupt.empty()) {
    db_->Exec("DELETE FROM overflow WHERE seq IN (" + SeqList(corrupt) + ");");
    evicted_ += corrupt.size();
    FIELDGATE_LOG_ERROR("overflow records corrupt, discarded", {IntField("count", static_cast<int64_t>(corrupt.size()))});
  }
  return out;
}

void OverflowCache::Remove(const std::vector<Record>& records) {
  std::lock_guard lock(mutex_);
  db_->Exec("DELETE FROM overflow WHERE seq IN (" + SeqList(records) + ");");
}

void OverflowCache::MarkAttempt(const std::vector<Record>& records) {
  std::lock_guard lock(mutex_);
  db_->Exec("UPDATE overflow SET attempts = attempts + 1 WHERE seq IN (" + SeqList(records) + ");");
}

ReplayResult OverflowCache::Replay(store::TimeSeriesStore& store, uint32_t batch_size) {
  if (batch_size == 0) batch_size = 1;

  ReplayResult result;

  try {
    for (;;) {
      auto chunk = Oldest(batch_size);
      if (chunk.empty()) break;

      std::vector<fieldgate::v1::Point> points;
      points.reserve(chunk.size());
      for (const auto& r : chunk) points.push_back(r.point);

      auto written = store.WriteBatch(points);
      if (!written) {
        MarkAttempt(chunk);
        result.failed = true;
        result.error  = std::string(db::ToString(written.code)) + ": " + written.message;
        break;
      }

      Remove(chunk);
      result.replayed += chunk.size();
      replayed_ += chunk.size();

      if (chunk.size() < batch_size) break;
    }
  } catch (const db::sqlite::SqliteError& e) {
    // a queue read error is never an empty queue
    result.failed = true;
    result.error  = e.what();
  }

  result.remaining = Depth();

  if (result.replayed > 0) {
    std::lock_guard lock(mutex_);
    last_replay_ = util::Now();
  }

  if (result.failed) {
    FIELDGATE_LOG_WARN("overflow replay stopped",
                       {IntField("replayed", static_cast<int64_t>(result.replayed)), IntField("remaining", static_cast<int64_t>(result.remaining)),
                        StringField("error", result.error)});
  } else if (result.replayed > 0) {
    FIELDGATE_LOG_INFO("overflow replay complete",
                       {IntField("replayed", static_cast<int64_t>(result.replayed)), IntField("remaining", static_cast<int64_t>(result.remaining))});
  }

  return result;
}

// ------------------------------------------------------------------
// Introspection
// ------------------------------------------------------------------

uint64_t OverflowCache::Depth() const {
  std::lock_guard lock(mutex_);
  return db_->QueryU64("SELECT COUNT(*) FROM overflow;");
}

std::optional<util::TimePoint> OverflowCache::LastReplay() const {
  std::lock_guard lock(mutex_);
  return last_replay_;
}

std::vector<fieldgate::v1::Point> OverflowCache::Peek(uint32_t limit) const {
  std::lock_guard lock(mutex_);

  std::vector<fieldgate::v1::Point> out;
  auto                              stmt = db_->Prepare("SELECT payload FROM overflow ORDER BY seq LIMIT ?;");
  sqlite3_bind_int64(stmt.get(), 1, limit);

  while (db_->StepRow(stmt.get(), "overflow peek")) {
    fieldgate::v1::Point point;
    // unparseable rows are left for the next replay to discard
    if (point.ParseFromArray(sqlite3_column_blob(stmt.get(), 0), sqlite3_column_bytes(stmt.get(), 0))) {
      out.push_back(std::move(point));
    }
  }
  return out;
}

uint32_t OverflowCache::MaxAttempts() const {
  std::lock_guard lock(mutex_);
  return static_cast<uint32_t>(db_->QueryU64("SELECT COALESCE(MAX(attempts), 0) FROM overflow;"));
}

} // namespace fieldgate::overflow
