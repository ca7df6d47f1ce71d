#pragma once

#include <memory>
#include <mutex>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/store/timeseries_store.hpp"

namespace fieldgate::store::sqlite {

/*
  Time-series store on a local SQLite file.

  Schema:
    points(measurement, series_key, ts_ms, payload)
    PRIMARY KEY(measurement, series_key, ts_ms)

  payload is the serialized fieldgate.core.v1.Point. Writes go through
  INSERT .. ON CONFLICT DO UPDATE so a replayed point overwrites itself.
*/
class SqliteTimeSeriesStore final : public TimeSeriesStore {
 public:
  explicit SqliteTimeSeriesStore(std::shared_ptr<db::sqlite::SqliteDB> db);

  db::Result WriteBatch(const std::vector<fieldgate::v1::Point>& points) override;
  bool       Healthy() override;
  uint64_t   PointCount() override;

  std::optional<util::TimePoint> LatestTimestamp() override;

  std::string Name() const override {
    return "sqlite";
  }

  static void Bootstrap(db::sqlite::SqliteDB& db);

 private:
  static db::Result Translate(int rc, std::string message);

  std::shared_ptr<db::sqlite::SqliteDB> db_;

  // one connection: transactions must not interleave
  std::mutex write_mutex_;
};

} // namespace fieldgate::store::sqlite
