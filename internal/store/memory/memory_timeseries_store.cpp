#include "memory_timeseries_store.hpp"

namespace fieldgate::store::memory {

db::Result MemoryTimeSeriesStore::WriteBatch(const std::vector<fieldgate::v1::Point>& points) {
  std::lock_guard lock(mutex_);
  for (const auto& point : points) {
    Key key{point.measurement(), SeriesKey(point), util::ToUnixMillis(util::FromProto(point.timestamp()))};
    points_[key] = point;
  }
  ++batches_;
  return db::Result::Ok();
}

bool MemoryTimeSeriesStore::Healthy() {
  return true;
}

uint64_t MemoryTimeSeriesStore::PointCount() {
  std::lock_guard lock(mutex_);
  return points_.size();
}

std::optional<util::TimePoint> MemoryTimeSeriesStore::LatestTimestamp() {
  std::lock_guard lock(mutex_);

  std::optional<uint64_t> latest;
  for (const auto& [key, point] : points_) {
    const auto ts = std::get<2>(key);
    if (!latest || ts > *latest) latest = ts;
  }
  if (!latest) return std::nullopt;
  return util::FromUnixMillis(*latest);
}

uint64_t MemoryTimeSeriesStore::BatchCount() const {
  std::lock_guard lock(mutex_);
  return batches_;
}

std::vector<fieldgate::v1::Point> MemoryTimeSeriesStore::Series(const std::string& measurement, const std::string& series_key) const {
  std::lock_guard lock(mutex_);

  std::vector<fieldgate::v1::Point> out;
  for (const auto& [key, point] : points_) {
    if (std::get<0>(key) == measurement && std::get<1>(key) == series_key) {
      out.push_back(point);
    }
  }
  return out;
}

} // namespace fieldgate::store::memory
