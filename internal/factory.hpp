#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/broadcast/broadcast_hub.hpp"
#include "internal/device/device_link.hpp"
#include "internal/overflow/overflow_cache.hpp"
#include "internal/pipeline/batch_writer.hpp"
#include "internal/pipeline/poll_scheduler.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/service/status_service.hpp"
#include "internal/snapshot/snapshot_store.hpp"
#include "internal/store/timeseries_store.hpp"

namespace fieldgate::factory {

/*
  Application

  Owns every long-lived component. Built once by Build(); everything here
  lives for the lifetime of the process.

  Start order: polling, flush timer, replay timer, realtime hub.
  Stop order:  realtime hub, polling, final flush, flush and replay
               timers, device link.
*/
class Application {
 public:
  Application() = default;
  ~Application();

  Application(const Application&)            = delete;
  Application& operator=(const Application&) = delete;

  void Start();
  void Stop();

  fieldgate::runtime::config::RuntimeConfig config;

  std::shared_ptr<device::DeviceLink>       link;
  std::shared_ptr<snapshot::SnapshotStore>  snapshot;
  std::shared_ptr<store::TimeSeriesStore>   store;
  std::shared_ptr<overflow::OverflowCache>  overflow;
  std::shared_ptr<pipeline::BatchWriter>    batch;
  std::shared_ptr<pipeline::PollScheduler>  poll;
  std::shared_ptr<broadcast::BroadcastHub>  hub;
  std::shared_ptr<service::StatusService>   status_service;

  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;

 private:
  std::unique_ptr<runtime::PeriodicTask> flush_task_;
  std::unique_ptr<runtime::PeriodicTask> replay_task_;
  bool                                   started_ = false;
};

/*
  Build

  Constructs the entire pipeline from runtime config.

  This is the composition root of the application and the only place
  that knows concrete store and transport types. Throws
  util::InvalidConfig for layouts or settings that cannot run.
*/
std::unique_ptr<Application> Build(const fieldgate::runtime::config::RuntimeConfig& config);

// Store selected by config.store(); exposed for tests.
std::shared_ptr<store::TimeSeriesStore> BuildStore(const fieldgate::runtime::config::StoreConfig& config);

} // namespace fieldgate::factory
