#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "fieldgate/v1.hpp"
#include "internal/util/time.hpp"

namespace fieldgate::snapshot {

using Snapshot = std::map<std::string, fieldgate::v1::DeviceReading>;

/*
  Latest reading per device id.

  In-memory only. Writers are the poll scheduler; readers are the push
  loop and status RPCs. Every accessor returns a copy taken under a shared
  lock, so callers never hold the lock across I/O.
*/
class SnapshotStore {
 public:
  // Replaces the device's reading unless the stored one is newer.
  bool Update(const fieldgate::v1::DeviceReading& reading);

  Snapshot GetAll() const;

  std::optional<fieldgate::v1::DeviceReading> Get(const std::string& device_id) const;

  std::vector<fieldgate::v1::DeviceReading> ByType(const std::string& device_type) const;

  size_t Size() const;

  std::optional<util::TimePoint> LatestTimestamp() const;

 private:
  mutable std::shared_mutex mutex_;
  Snapshot                  readings_;
};

} // namespace fieldgate::snapshot
