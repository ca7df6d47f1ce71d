#pragma once

#include <map>
#include <mutex>
#include <tuple>

#include "internal/store/timeseries_store.hpp"

namespace fieldgate::store::memory {

class MemoryTimeSeriesStore final : public TimeSeriesStore {
 public:
  db::Result WriteBatch(const std::vector<fieldgate::v1::Point>& points) override;
  bool       Healthy() override;
  uint64_t   PointCount() override;

  std::optional<util::TimePoint> LatestTimestamp() override;

  std::string Name() const override {
    return "memory";
  }

  // Number of WriteBatch calls that succeeded.
  uint64_t BatchCount() const;

  // Points of one series ordered by timestamp.
  std::vector<fieldgate::v1::Point> Series(const std::string& measurement, const std::string& series_key) const;

 private:
  using Key = std::tuple<std::string, std::string, uint64_t>;

  mutable std::mutex                  mutex_;
  std::map<Key, fieldgate::v1::Point> points_;
  uint64_t                            batches_ = 0;
};

} // namespace fieldgate::store::memory
