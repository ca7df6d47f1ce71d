#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fieldgate/v1.hpp"
#include "internal/db/api/result.hpp"
#include "internal/util/time.hpp"

namespace fieldgate::store {

/*
  Time-series store abstraction.

  WriteBatch is all-or-nothing: either every point of the batch is
  durable or none is and the Result says why.

  Points are keyed by (measurement, series key, timestamp). Writing a key
  that already exists overwrites it, so replaying a batch that already
  landed leaves history unchanged.

  Implementations:
    memory   -> in-process map
    sqlite   -> local file, upsert on primary key
    postgres -> libpqxx, upsert on primary key
*/
class TimeSeriesStore {
 public:
  virtual ~TimeSeriesStore() = default;

  virtual db::Result WriteBatch(const std::vector<fieldgate::v1::Point>& points) = 0;

  // Cheap liveness probe; never throws.
  virtual bool Healthy() = 0;

  virtual uint64_t PointCount() = 0;

  virtual std::optional<util::TimePoint> LatestTimestamp() = 0;

  virtual std::string Name() const = 0;
};

using TimeSeriesStorePtr = std::shared_ptr<TimeSeriesStore>;

// Tags rendered as sorted "k=v,k=v"; identifies one series within a measurement.
std::string SeriesKey(const fieldgate::v1::Point& point);

} // namespace fieldgate::store
