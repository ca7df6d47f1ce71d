#pragma once

#include <memory>

namespace fieldgate::device {
class DeviceLink;
}
namespace fieldgate::pipeline {
class PollScheduler;
class BatchWriter;
}
namespace fieldgate::overflow {
class OverflowCache;
}
namespace fieldgate::store {
class TimeSeriesStore;
}
namespace fieldgate::snapshot {
class SnapshotStore;
}
namespace fieldgate::broadcast {
class BroadcastHub;
}

namespace fieldgate::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fieldgate::device::DeviceLink>      link;
  std::shared_ptr<fieldgate::pipeline::PollScheduler> poll;
  std::shared_ptr<fieldgate::pipeline::BatchWriter>   batch;
  std::shared_ptr<fieldgate::overflow::OverflowCache> overflow;
  std::shared_ptr<fieldgate::store::TimeSeriesStore>  store;
  std::shared_ptr<fieldgate::snapshot::SnapshotStore> snapshot;
  std::shared_ptr<fieldgate::broadcast::BroadcastHub> hub;
};

} // namespace fieldgate::service
