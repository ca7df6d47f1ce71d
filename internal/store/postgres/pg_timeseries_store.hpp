#pragma once

#include <chrono>
#include <memory>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/store/timeseries_store.hpp"

namespace fieldgate::store::postgres {

/*
  Time-series store on PostgreSQL.

  Same key and upsert semantics as the sqlite store; payload is the
  point rendered as JSONB so it stays queryable from SQL.
*/
class PgTimeSeriesStore final : public TimeSeriesStore {
 public:
  PgTimeSeriesStore(std::shared_ptr<db::postgres::PgPool> pool, std::chrono::milliseconds write_timeout);

  db::Result WriteBatch(const std::vector<fieldgate::v1::Point>& points) override;
  bool       Healthy() override;
  uint64_t   PointCount() override;

  std::optional<util::TimePoint> LatestTimestamp() override;

  std::string Name() const override {
    return "postgres";
  }

  // PgPool on-connect hook
  static void PrepareStatements(pqxx::connection& conn);
  static void Bootstrap(db::postgres::PgPool& pool);

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
  std::chrono::milliseconds             write_timeout_;
};

} // namespace fieldgate::store::postgres
