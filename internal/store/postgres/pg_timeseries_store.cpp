#include "pg_timeseries_store.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/db/postgres/pg_tx.hpp"

namespace fieldgate::store::postgres {

using db::ErrorCode;
using db::Result;

PgTimeSeriesStore::PgTimeSeriesStore(std::shared_ptr<db::postgres::PgPool> pool, std::chrono::milliseconds write_timeout)
    : pool_(std::move(pool)), write_timeout_(write_timeout) {
}

void PgTimeSeriesStore::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_point",
               "INSERT INTO points(measurement,series_key,ts_ms,payload) VALUES($1,$2,$3,$4::jsonb) "
               "ON CONFLICT(measurement,series_key,ts_ms) DO UPDATE SET payload=excluded.payload");
  conn.prepare("count_points", "SELECT COUNT(*) FROM points");
  conn.prepare("latest_point_ts", "SELECT MAX(ts_ms) FROM points");
}

void PgTimeSeriesStore::Bootstrap(db::postgres::PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS points (measurement TEXT NOT NULL, series_key TEXT NOT NULL, ts_ms BIGINT NOT NULL, payload JSONB NOT NULL, "
          "PRIMARY KEY (measurement, series_key, ts_ms));");
  tx.exec("CREATE INDEX IF NOT EXISTS points_ts ON points(ts_ms);");
  tx.commit();
}

Result PgTimeSeriesStore::WriteBatch(const std::vector<fieldgate::v1::Point>& points) {
  if (points.empty()) return Result::Ok();

  try {
    db::postgres::PgTransaction tx(pool_, write_timeout_);

    for (const auto& point : points) {
      std::string json;
      auto        status = google::protobuf::util::MessageToJsonString(point, &json);
      if (!status.ok()) {
        return Result::Err(ErrorCode::InternalError, std::string(status.message()));
      }

      const auto ts_ms = static_cast<int64_t>(util::ToUnixMillis(util::FromProto(point.timestamp())));
      tx.Work().exec_prepared("upsert_point", point.measurement(), SeriesKey(point), ts_ms, json);
    }

    tx.Commit();
    return Result::Ok();
  } catch (const db::postgres::PoolExhausted& e) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  } catch (const pqxx::broken_connection& e) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  } catch (const pqxx::query_cancelled& e) {
    return Result::Err(ErrorCode::Timeout, e.what());
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

bool PgTimeSeriesStore::Healthy() {
  try {
    auto                 conn = pool_->Acquire();
    pqxx::nontransaction tx(*conn);
    tx.exec("SELECT 1");
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

uint64_t PgTimeSeriesStore::PointCount() {
  auto                 conn = pool_->Acquire();
  pqxx::nontransaction tx(*conn);
  auto                 res = tx.exec_prepared("count_points");
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

std::optional<util::TimePoint> PgTimeSeriesStore::LatestTimestamp() {
  auto                 conn = pool_->Acquire();
  pqxx::nontransaction tx(*conn);
  auto                 res = tx.exec_prepared("latest_point_ts");
  if (res.empty() || res[0][0].is_null()) return std::nullopt;
  return util::FromUnixMillis(res[0][0].as<uint64_t>());
}

} // namespace fieldgate::store::postgres
