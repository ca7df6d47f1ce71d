#include "snapshot_store.hpp"

#include <mutex>

namespace fieldgate::snapshot {

using fieldgate::v1::DeviceReading;

static bool Older(const google::protobuf::Timestamp& a, const google::protobuf::Timestamp& b) {
  if (a.seconds() != b.seconds()) return a.seconds() < b.seconds();
  return a.nanos() < b.nanos();
}

bool SnapshotStore::Update(const DeviceReading& reading) {
  std::unique_lock lock(mutex_);

  auto it = readings_.find(reading.device_id());
  if (it == readings_.end()) {
    readings_.emplace(reading.device_id(), reading);
    return true;
  }

  if (Older(reading.timestamp(), it->second.timestamp())) return false;

  it->second = reading;
  return true;
}

Snapshot SnapshotStore::GetAll() const {
  std::shared_lock lock(mutex_);
  return readings_;
}

std::optional<DeviceReading> SnapshotStore::Get(const std::string& device_id) const {
  std::shared_lock lock(mutex_);
  auto it = readings_.find(device_id);
  if (it == readings_.end()) return std::nullopt;
  return it->second;
}

std::vector<DeviceReading> SnapshotStore::ByType(const std::string& device_type) const {
  std::shared_lock lock(mutex_);

  std::vector<DeviceReading> out;
  for (const auto& [_, reading] : readings_) {
    if (reading.device_type() == device_type) out.push_back(reading);
  }
  return out;
}

size_t SnapshotStore::Size() const {
  std::shared_lock lock(mutex_);
  return readings_.size();
}

std::optional<util::TimePoint> SnapshotStore::LatestTimestamp() const {
  std::shared_lock lock(mutex_);

  std::optional<util::TimePoint> latest;
  for (const auto& [_, reading] : readings_) {
    auto tp = util::FromProto(reading.timestamp());
    if (!latest || tp > *latest) latest = tp;
  }
  return latest;
}

} // namespace fieldgate::snapshot
