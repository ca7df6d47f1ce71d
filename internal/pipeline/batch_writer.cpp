#include "batch_writer.hpp"

#include "internal/observability/logging.hpp"

namespace fieldgate::pipeline {

using fieldgate::v1::DeviceReading;
using fieldgate::v1::Point;
using observability::IntField;
using observability::StringField;

const char* ToString(FlushOutcome outcome) {
  switch (outcome) {
    case FlushOutcome::kNotDue:
      return "not_due";
    case FlushOutcome::kEmpty:
      return "empty";
    case FlushOutcome::kWritten:
      return "written";
    case FlushOutcome::kOverflowed:
      return "overflowed";
  }
  return "unknown";
}

BatchWriter::BatchWriter(BatchPolicy policy, store::TimeSeriesStorePtr store, std::shared_ptr<overflow::OverflowCache> overflow)
    : policy_(std::move(policy)), store_(std::move(store)), overflow_(std::move(overflow)) {
  if (policy_.cycle_threshold == 0) policy_.cycle_threshold = 1;
}

std::vector<Point> BatchWriter::ToPoints(const std::vector<DeviceReading>& readings, const std::string& measurement) {
  std::vector<Point> points;

  for (const auto& reading : readings) {
    for (const auto& [tag, module] : reading.modules()) {
      if (module.fields().empty()) continue;

      Point p;
      p.set_measurement(measurement);

      auto& tags           = *p.mutable_tags();
      tags["device_id"]    = reading.device_id();
      tags["device_type"]  = reading.device_type();
      tags["module_type"]  = module.module_type();
      tags["module_tag"]   = tag;
      tags["block_id"]     = std::to_string(reading.block_id());

      *p.mutable_fields()    = module.fields();
      *p.mutable_timestamp() = reading.timestamp();
      points.push_back(std::move(p));
    }
  }
  return points;
}

// ------------------------------------------------------------------
// Buffer
// ------------------------------------------------------------------

void BatchWriter::RecordCycle(const std::vector<DeviceReading>& readings, util::TimePoint now) {
  std::lock_guard lock(mutex_);

  if (!oldest_cycle_) oldest_cycle_ = now;
  ++pending_cycles_;

  for (const auto& reading : readings) {
    for (const auto& [_, module] : reading.modules()) {
      if (!module.fields().empty()) ++pending_points_;
    }
    pending_.push_back(reading);
  }
}

bool BatchWriter::FlushDue(util::TimePoint now) const {
  std::lock_guard lock(mutex_);

  if (pending_cycles_ == 0) return false;
  if (pending_cycles_ >= policy_.cycle_threshold) return true;
  if (policy_.max_points > 0 && pending_points_ >= policy_.max_points) return true;
  return oldest_cycle_ && now - *oldest_cycle_ >= policy_.max_age;
}

BatchStats BatchWriter::Stats() const {
  std::lock_guard lock(mutex_);

  BatchStats s     = stats_;
  s.pending_points = pending_points_;
  s.pending_cycles = pending_cycles_;
  return s;
}

// ------------------------------------------------------------------
// Flush
// ------------------------------------------------------------------

FlushOutcome BatchWriter::FlushIfDue(util::TimePoint now) {
  std::lock_guard flush(flush_mutex_);
  if (!FlushDue(now)) return FlushOutcome::kNotDue;
  return Write(TakeBatch());
}

FlushOutcome BatchWriter::Flush() {
  std::lock_guard flush(flush_mutex_);
  return Write(TakeBatch());
}

BatchWriter::Batch BatchWriter::TakeBatch() {
  std::lock_guard lock(mutex_);

  Batch batch;
  batch.readings.swap(pending_);
  batch.cycles    = pending_cycles_;
  pending_points_ = 0;
  pending_cycles_ = 0;
  oldest_cycle_.reset();
  return batch;
}

FlushOutcome BatchWriter::Write(Batch batch) {
  auto points = ToPoints(batch.readings, policy_.measurement);
  if (points.empty()) return FlushOutcome::kEmpty;

  db::Result written = store_->Healthy() ? store_->WriteBatch(points) : db::Result::Err(db::ErrorCode::Unavailable, "store unhealthy");

  if (written) {
    std::lock_guard lock(mutex_);
    ++stats_.flushes;
    stats_.written_points += points.size();
    stats_.last_successful_flush = util::Now();

    FIELDGATE_LOG_INFO("batch written", {StringField("store", store_->Name()), IntField("points", static_cast<int64_t>(points.size())),
                                         IntField("cycles", static_cast<int64_t>(batch.cycles))});
    return FlushOutcome::kWritten;
  }

  FIELDGATE_LOG_WARN("batch write failed, handing to overflow cache",
                     {StringField("store", store_->Name()), StringField("code", db::ToString(written.code)), StringField("error", written.message),
                      IntField("points", static_cast<int64_t>(points.size()))});

  bool persisted = true;
  try {
    overflow_->Enqueue(points);
  } catch (const std::exception& e) {
    persisted = false;
    FIELDGATE_LOG_ERROR("overflow enqueue failed, batch lost", {IntField("points", static_cast<int64_t>(points.size())), StringField("error", e.what())});
  }

  std::lock_guard lock(mutex_);
  ++stats_.flushes;
  ++stats_.failed_flushes;
  stats_.failed_points += points.size();
  if (!persisted) stats_.lost_points += points.size();
  return FlushOutcome::kOverflowed;
}

} // namespace fieldgate::pipeline
