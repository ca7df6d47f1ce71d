#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "fieldgate/v1.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/store/timeseries_store.hpp"
#include "internal/util/time.hpp"

namespace fieldgate::overflow {

struct ReplayResult {
  uint64_t    replayed  = 0;
  uint64_t    remaining = 0;
  bool        failed    = false;
  std::string error;
};

/*
  Durable FIFO of points whose store write failed.

  Backed by a SQLite file opened with synchronous=FULL, so an enqueued
  point survives a crash or restart. Records are ordered by an
  autoincrement sequence; replay drains in that order and eviction removes
  from the same end.

  Locking:
    mutex_ covers individual statements only. The store write in Replay
    runs with no lock held, so Enqueue from the flush path is never
    blocked by a slow store.
*/
class OverflowCache {
 public:
  OverflowCache(const std::string& path, uint64_t capacity);

  // Appends the batch in order; returns how many old records were evicted
  // to stay within capacity.
  uint64_t Enqueue(const std::vector<fieldgate::v1::Point>& points, util::TimePoint now = util::Now());

  // Writes the oldest records in chunks of batch_size until empty or the
  // first failed write; a failed chunk stays queued with attempts + 1.
  // A queue read error also ends the pass as failed.
  ReplayResult Replay(store::TimeSeriesStore& store, uint32_t batch_size);

  uint64_t Depth() const;

  uint64_t EvictedCount() const {
    return evicted_;
  }

  uint64_t ReplayedCount() const {
    return replayed_;
  }

  std::optional<util::TimePoint> LastReplay() const;

  // Oldest-first, read-only; unparseable rows are skipped, not removed.
  std::vector<fieldgate::v1::Point> Peek(uint32_t limit) const;

  uint32_t MaxAttempts() const;

 private:
  struct Record {
    int64_t               seq = 0;
    fieldgate::v1::Point  point;
  };

  void                Bootstrap();
  std::vector<Record> Oldest(uint32_t limit) const;
  void                Remove(const std::vector<Record>& records);
  void                MarkAttempt(const std::vector<Record>& records);

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  uint64_t                              capacity_;

  mutable std::mutex mutex_;

  mutable std::atomic<uint64_t> evicted_{0};
  std::atomic<uint64_t>         replayed_{0};

  std::optional<util::TimePoint> last_replay_;
};

} // namespace fieldgate::overflow
