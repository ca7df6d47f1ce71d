#include "factory.hpp"

#include <stdexcept>

#include "internal/convert/value_converter.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/decode/block_layout.hpp"
#include "internal/device/simulated_transport.hpp"
#include "internal/grpc/realtime_server.hpp"
#include "internal/grpc/status_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/memory/memory_timeseries_store.hpp"
#include "internal/store/sqlite/sqlite_timeseries_store.hpp"
#include "internal/util/errors.hpp"
#if FIELDGATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/store/postgres/pg_timeseries_store.hpp"
#endif

namespace fieldgate::factory {

using fieldgate::runtime::config::RuntimeConfig;
using fieldgate::runtime::config::StoreConfig;
using observability::IntField;
using observability::StringField;
using std::chrono::milliseconds;

std::shared_ptr<store::TimeSeriesStore> BuildStore(const StoreConfig& config) {
  if (config.has_sqlite()) {
    const auto timeout = milliseconds(config.write_timeout_ms() == 0 ? 30000 : config.write_timeout_ms());
    auto       db      = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path(), db::sqlite::SqliteDB::Sync::kNormal, timeout);
    return std::make_shared<store::sqlite::SqliteTimeSeriesStore>(std::move(db));
  }

  if (config.has_postgres()) {
#if FIELDGATE_DB_POSTGRES
    const auto& pg   = config.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? 4 : pg.max_connections(),
                                                          milliseconds(config.write_timeout_ms()),
                                                          &store::postgres::PgTimeSeriesStore::PrepareStatements);
    store::postgres::PgTimeSeriesStore::Bootstrap(*pool);
    return std::make_shared<store::postgres::PgTimeSeriesStore>(std::move(pool), milliseconds(config.write_timeout_ms()));
#else
    throw util::InvalidConfig("postgres store requested but not enabled at build time");
#endif
  }

  return std::make_shared<store::memory::MemoryTimeSeriesStore>();
}

namespace {

device::TransportPtr BuildTransport(const RuntimeConfig& config, const std::vector<decode::BlockLayout>& layouts) {
  const auto& device = config.device();
  if (device.transport() == "simulated") {
    return std::make_unique<device::SimulatedTransport>(layouts, device.simulated().seed(), device.simulated().fail_every());
  }
  throw util::InvalidConfig("unsupported device transport: " + device.transport());
}

} // namespace

std::unique_ptr<Application> Build(const RuntimeConfig& config) {
  auto app    = std::make_unique<Application>();
  app->config = config;

  // ------------------------------------------------------------------
  // Layouts and conversion (fatal on error)
  // ------------------------------------------------------------------
  auto layouts   = decode::CompileLayouts(config);
  auto converter = std::make_shared<const convert::ValueConverter>(config);

  // ------------------------------------------------------------------
  // Device link
  // ------------------------------------------------------------------
  const auto& dev = config.device();

  device::Endpoint endpoint;
  endpoint.host            = dev.endpoint().host();
  endpoint.rack            = dev.endpoint().rack();
  endpoint.slot            = dev.endpoint().slot();
  endpoint.connect_timeout = milliseconds(dev.endpoint().connect_timeout_ms());

  device::ReadRetryPolicy read_retry{dev.read_retry().max_attempts(), milliseconds(dev.read_retry().delay_ms())};
  device::ReconnectPolicy reconnect{dev.reconnect().max_attempts(), milliseconds(dev.reconnect().backoff_ms()), dev.reconnect().error_threshold()};

  app->link = std::make_shared<device::DeviceLink>(BuildTransport(config, layouts), endpoint, read_retry, reconnect);

  // ------------------------------------------------------------------
  // Delivery
  // ------------------------------------------------------------------
  app->snapshot = std::make_shared<snapshot::SnapshotStore>();
  app->store    = BuildStore(config.store());
  app->overflow = std::make_shared<overflow::OverflowCache>(config.overflow().path(), config.overflow().capacity());

  pipeline::BatchPolicy policy;
  policy.cycle_threshold = config.batch().cycle_threshold();
  policy.max_age         = milliseconds(config.batch().max_age_ms());
  policy.max_points      = config.batch().max_points();
  policy.measurement     = config.batch().measurement();
  app->batch             = std::make_shared<pipeline::BatchWriter>(policy, app->store, app->overflow);

  app->poll = std::make_shared<pipeline::PollScheduler>(app->link, std::move(layouts), converter, app->snapshot, app->batch);

  // ------------------------------------------------------------------
  // Realtime
  // ------------------------------------------------------------------
  broadcast::HubOptions hub;
  hub.push_interval     = milliseconds(config.realtime().push_interval_ms());
  hub.heartbeat_timeout = milliseconds(config.realtime().heartbeat_timeout_ms());
  hub.reap_interval     = milliseconds(config.realtime().reap_interval_ms());
  hub.source            = config.realtime().source();
  app->hub              = std::make_shared<broadcast::BroadcastHub>(app->snapshot, hub);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.link     = app->link;
  ctx.poll     = app->poll;
  ctx.batch    = app->batch;
  ctx.overflow = app->overflow;
  ctx.store    = app->store;
  ctx.snapshot = app->snapshot;
  ctx.hub      = app->hub;

  app->status_service = std::make_shared<service::StatusService>(ctx);

  broadcast::QueueOptions queue;
  queue.write_timeout = milliseconds(config.realtime().write_timeout_ms());
  queue.max_pending   = config.realtime().max_pending_messages();
  app->grpc_services.push_back(std::make_shared<grpc::RealtimeServer>(app->hub, queue));
  app->grpc_services.push_back(std::make_shared<grpc::StatusServer>(app->status_service));

  FIELDGATE_LOG_INFO("pipeline built", {StringField("transport", dev.transport()), StringField("store", app->store->Name()),
                                        IntField("devices", static_cast<int64_t>(app->poll->DeviceCount())),
                                        StringField("overflow", config.overflow().path())});
  return app;
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

Application::~Application() {
  Stop();
}

void Application::Start() {
  if (started_) return;
  started_ = true;

  if (config.polling().disabled()) {
    FIELDGATE_LOG_WARN("polling disabled by config");
  } else {
    poll->Start(milliseconds(config.polling().interval_ms()));
  }

  flush_task_ = std::make_unique<runtime::PeriodicTask>("batch-flush", milliseconds(config.batch().check_interval_ms()), [this] { batch->FlushIfDue(); });

  const auto replay_batch = config.overflow().replay_batch_size();
  replay_task_            = std::make_unique<runtime::PeriodicTask>("overflow-replay", milliseconds(config.overflow().replay_interval_ms()), [this, replay_batch] {
    if (overflow->Depth() == 0) return;
    if (!store->Healthy()) {
      FIELDGATE_LOG_WARN("store unhealthy, overflow replay deferred", {IntField("depth", static_cast<int64_t>(overflow->Depth()))});
      return;
    }
    overflow->Replay(*store, replay_batch);
  });

  flush_task_->Start();
  replay_task_->Start();
  hub->Start();
}

void Application::Stop() {
  if (!started_) return;
  started_ = false;

  hub->Stop();
  poll->Stop();

  auto outcome = batch->Flush();
  FIELDGATE_LOG_INFO("final flush", {StringField("outcome", pipeline::ToString(outcome))});

  flush_task_->Stop();
  replay_task_->Stop();

  link->Disconnect();
  FIELDGATE_LOG_INFO("pipeline stopped");
}

} // namespace fieldgate::factory
