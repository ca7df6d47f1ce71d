#include "poll_scheduler.hpp"

#include "internal/decode/block_decoder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldgate::pipeline {

using fieldgate::v1::DeviceReading;
using observability::IntField;
using observability::StringField;

const char* ToString(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::kSuccess:
      return "success";
    case CycleOutcome::kPartialFailure:
      return "partial_failure";
    case CycleOutcome::kTotalFailure:
      return "total_failure";
  }
  return "unknown";
}

PollScheduler::PollScheduler(std::shared_ptr<device::DeviceLink> link, std::vector<decode::BlockLayout> blocks,
                             std::shared_ptr<const convert::ValueConverter> converter, std::shared_ptr<snapshot::SnapshotStore> snapshot,
                             std::shared_ptr<BatchWriter> batch)
    : link_(std::move(link)),
      blocks_(std::move(blocks)),
      converter_(std::move(converter)),
      snapshot_(std::move(snapshot)),
      batch_(std::move(batch)) {
}

PollScheduler::~PollScheduler() {
  Stop();
}

size_t PollScheduler::DeviceCount() const {
  size_t n = 0;
  for (const auto& block : blocks_) n += block.devices.size();
  return n;
}

// ------------------------------------------------------------------
// Cycle
// ------------------------------------------------------------------

void PollScheduler::ReadBlock(const decode::BlockLayout& block, util::TimePoint now, CycleReport& report) {
  device::Bytes raw;
  try {
    raw = link_->ReadBlock(block.block_id, block.offset, block.size);
  } catch (const util::ConnectionError& e) {
    ++report.blocks_failed;
    report.devices_failed += static_cast<uint32_t>(block.devices.size());
    FIELDGATE_LOG_WARN("block skipped", {StringField("block", block.name), StringField("reason", "connection"), StringField("error", e.what())});
    return;
  } catch (const util::ReadTimeout& e) {
    ++report.blocks_failed;
    report.devices_failed += static_cast<uint32_t>(block.devices.size());
    FIELDGATE_LOG_WARN("block skipped", {StringField("block", block.name), StringField("reason", "timeout"), StringField("error", e.what())});
    return;
  }

  const auto ts = util::ToProto(now);

  for (const auto& device : block.devices) {
    try {
      auto decoded = decode::DecodeDevice(raw, device);

      DeviceReading reading;
      reading.set_device_id(device.device_id);
      reading.set_device_name(device.device_name);
      reading.set_device_type(device.device_type);
      reading.set_block_id(block.block_id);
      *reading.mutable_timestamp() = ts;

      for (const auto& [tag, module] : decoded) {
        auto& out = (*reading.mutable_modules())[tag];
        out.set_module_type(module.module_type);
        for (const auto& [field, value] : converter_->Convert(module.module_type, module.values)) {
          (*out.mutable_fields())[field] = value;
        }
      }

      report.readings.push_back(std::move(reading));
      ++report.devices_ok;
    } catch (const util::DecodeError& e) {
      ++report.devices_failed;
      FIELDGATE_LOG_WARN("device skipped", {StringField("device_id", device.device_id), StringField("reason", "decode"), StringField("error", e.what())});
    }
  }
}

CycleReport PollScheduler::RunCycle(util::TimePoint now) {
  if (reconnect_requested_.exchange(false)) {
    FIELDGATE_LOG_INFO("operator reconnect requested");
    if (!link_->Reconnect()) FIELDGATE_LOG_WARN("operator reconnect failed");
  }

  CycleReport report;
  for (const auto& block : blocks_) {
    ReadBlock(block, now, report);
  }

  if (report.devices_failed == 0) {
    report.outcome = CycleOutcome::kSuccess;
  } else if (report.devices_ok == 0) {
    report.outcome = CycleOutcome::kTotalFailure;
  } else {
    report.outcome = CycleOutcome::kPartialFailure;
  }

  // snapshot before batch
  for (const auto& reading : report.readings) {
    if (!snapshot_->Update(reading)) {
      FIELDGATE_LOG_WARN("stale reading not applied to snapshot", {StringField("device_id", reading.device_id())});
    }
  }
  batch_->RecordCycle(report.readings, now);

  std::optional<CycleOutcome> previous;
  uint64_t                    cycle;
  {
    std::lock_guard lock(stats_mutex_);
    previous = stats_.last_outcome;
    cycle    = ++stats_.total_cycles;
    if (report.outcome != CycleOutcome::kSuccess) ++stats_.failed_cycles;
    stats_.last_outcome    = report.outcome;
    stats_.last_cycle_time = now;
  }

  if (!previous || *previous != report.outcome) {
    FIELDGATE_LOG_INFO("poll outcome changed", {StringField("outcome", ToString(report.outcome)), IntField("devices_ok", report.devices_ok),
                                                IntField("devices_failed", report.devices_failed), IntField("cycle", static_cast<int64_t>(cycle))});
  } else {
    FIELDGATE_LOG_DEBUG("poll cycle", {StringField("outcome", ToString(report.outcome)), IntField("devices_ok", report.devices_ok),
                                       IntField("devices_failed", report.devices_failed), IntField("cycle", static_cast<int64_t>(cycle))});
  }

  return report;
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void PollScheduler::Start(std::chrono::milliseconds interval) {
  if (task_) return;

  if (!link_->Connect()) {
    FIELDGATE_LOG_WARN("device not reachable at start, polling anyway");
  }

  task_ = std::make_unique<runtime::PeriodicTask>("poll", interval, [this] { RunCycle(); }, true);
  task_->Start();
  running_ = true;

  FIELDGATE_LOG_INFO("polling started", {IntField("interval_ms", interval.count()), IntField("devices", static_cast<int64_t>(DeviceCount()))});
}

void PollScheduler::Stop() {
  if (!task_) return;
  task_->Stop();
  running_ = false;
  task_.reset();
  FIELDGATE_LOG_INFO("polling stopped");
}

PollStats PollScheduler::Stats() const {
  std::lock_guard lock(stats_mutex_);
  PollStats       s = stats_;
  s.running         = running_;
  return s;
}

} // namespace fieldgate::pipeline
