#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "fieldgate/v1.hpp"
#include "internal/overflow/overflow_cache.hpp"
#include "internal/store/timeseries_store.hpp"
#include "internal/util/time.hpp"

namespace fieldgate::pipeline {

struct BatchPolicy {
  uint32_t                  cycle_threshold = 12;
  std::chrono::milliseconds max_age{120000};
  uint32_t                  max_points  = 500;
  std::string               measurement = "sensor_data";
};

struct BatchStats {
  uint64_t pending_points = 0;
  uint64_t pending_cycles = 0;
  uint64_t written_points = 0;
  // write failed; handed to the overflow cache
  uint64_t failed_points  = 0;
  // write failed and the overflow cache could not take them either
  uint64_t lost_points    = 0;
  uint64_t flushes        = 0;
  uint64_t failed_flushes = 0;

  std::optional<util::TimePoint> last_successful_flush;
};

enum class FlushOutcome { kNotDue, kEmpty, kWritten, kOverflowed };

const char* ToString(FlushOutcome outcome);

/*
  Buffers readings between store writes.

  A flush is due once cycle_threshold poll cycles were recorded, the oldest
  buffered cycle is max_age old, or max_points points are pending. A flush
  takes the whole buffer; on a failed write the batch is handed to the
  overflow cache and the buffer stays cleared either way.

  The buffer mutex only covers append and swap; the store write itself
  runs unlocked so the poll scheduler never waits on the store.
*/
class BatchWriter {
 public:
  BatchWriter(BatchPolicy policy, store::TimeSeriesStorePtr store, std::shared_ptr<overflow::OverflowCache> overflow);

  // One call per poll cycle, even with no readings.
  void RecordCycle(const std::vector<fieldgate::v1::DeviceReading>& readings, util::TimePoint now = util::Now());

  bool FlushDue(util::TimePoint now) const;

  FlushOutcome FlushIfDue(util::TimePoint now = util::Now());

  // Unconditional; used for the final flush on shutdown.
  FlushOutcome Flush();

  BatchStats Stats() const;

  // One point per module: measurement, tags {device_id, device_type,
  // module_type, module_tag, block_id}, module fields, reading timestamp.
  static std::vector<fieldgate::v1::Point> ToPoints(const std::vector<fieldgate::v1::DeviceReading>& readings, const std::string& measurement);

 private:
  struct Batch {
    std::vector<fieldgate::v1::DeviceReading> readings;
    uint64_t                                  cycles = 0;
  };

  Batch        TakeBatch();
  FlushOutcome Write(Batch batch);

  BatchPolicy                              policy_;
  store::TimeSeriesStorePtr                store_;
  std::shared_ptr<overflow::OverflowCache> overflow_;

  mutable std::mutex                        mutex_;
  std::vector<fieldgate::v1::DeviceReading> pending_;
  uint64_t                                  pending_points_ = 0;
  uint64_t                                  pending_cycles_ = 0;
  std::optional<util::TimePoint>            oldest_cycle_;

  BatchStats stats_;

  // one flush at a time; timer flush and final flush may race
  std::mutex flush_mutex_;
};

} // namespace fieldgate::pipeline
