#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "batch_writer.hpp"
#include "internal/convert/value_converter.hpp"
#include "internal/decode/block_layout.hpp"
#include "internal/device/device_link.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/snapshot/snapshot_store.hpp"

namespace fieldgate::pipeline {

enum class CycleOutcome { kSuccess, kPartialFailure, kTotalFailure };

const char* ToString(CycleOutcome outcome);

struct CycleReport {
  CycleOutcome outcome        = CycleOutcome::kTotalFailure;
  uint32_t     devices_ok     = 0;
  uint32_t     devices_failed = 0;
  uint32_t     blocks_failed  = 0;

  std::vector<fieldgate::v1::DeviceReading> readings;
};

struct PollStats {
  bool     running       = false;
  uint64_t total_cycles  = 0;
  uint64_t failed_cycles = 0;

  std::optional<CycleOutcome>    last_outcome;
  std::optional<util::TimePoint> last_cycle_time;
};

/*
  Drives one sampling cycle per interval.

  Each enabled block is read once through the device link; each device in
  it is decoded and converted independently. A failed read skips only the
  devices of that block, a failed decode only that device. Successful
  readings go to the snapshot first and then to the batch writer.

  The scheduler is the only caller of the device link. Reconnect requests
  from elsewhere are queued and served at the start of the next cycle.
*/
class PollScheduler {
 public:
  PollScheduler(std::shared_ptr<device::DeviceLink> link, std::vector<decode::BlockLayout> blocks,
                std::shared_ptr<const convert::ValueConverter> converter, std::shared_ptr<snapshot::SnapshotStore> snapshot,
                std::shared_ptr<BatchWriter> batch);
  ~PollScheduler();

  CycleReport RunCycle(util::TimePoint now = util::Now());

  void Start(std::chrono::milliseconds interval);
  void Stop();

  void RequestReconnect() {
    reconnect_requested_ = true;
  }

  PollStats Stats() const;

  size_t DeviceCount() const;

 private:
  void ReadBlock(const decode::BlockLayout& block, util::TimePoint now, CycleReport& report);

  std::shared_ptr<device::DeviceLink>            link_;
  std::vector<decode::BlockLayout>               blocks_;
  std::shared_ptr<const convert::ValueConverter> converter_;
  std::shared_ptr<snapshot::SnapshotStore>       snapshot_;
  std::shared_ptr<BatchWriter>                   batch_;

  std::unique_ptr<runtime::PeriodicTask> task_;
  std::atomic<bool>                      running_{false};
  std::atomic<bool>                      reconnect_requested_{false};

  mutable std::mutex stats_mutex_;
  PollStats          stats_;
};

} // namespace fieldgate::pipeline
