#include "status_service.hpp"

#include "fieldgate/v1.hpp"
#include "internal/broadcast/broadcast_hub.hpp"
#include "internal/device/device_link.hpp"
#include "internal/observability/logging.hpp"
#include "internal/overflow/overflow_cache.hpp"
#include "internal/pipeline/batch_writer.hpp"
#include "internal/pipeline/poll_scheduler.hpp"
#include "internal/snapshot/snapshot_store.hpp"
#include "internal/store/timeseries_store.hpp"
#include "internal/util/errors.hpp"

namespace fieldgate::service {

using namespace fieldgate::admin::v1;

namespace {

LinkState ToProto(device::LinkState state) {
  switch (state) {
    case device::LinkState::kDisconnected:
      return LINK_STATE_DISCONNECTED;
    case device::LinkState::kConnected:
      return LINK_STATE_CONNECTED;
    case device::LinkState::kReconnecting:
      return LINK_STATE_RECONNECTING;
  }
  return LINK_STATE_UNSPECIFIED;
}

CycleOutcome ToProto(pipeline::CycleOutcome outcome) {
  switch (outcome) {
    case pipeline::CycleOutcome::kSuccess:
      return CYCLE_OUTCOME_SUCCESS;
    case pipeline::CycleOutcome::kPartialFailure:
      return CYCLE_OUTCOME_PARTIAL_FAILURE;
    case pipeline::CycleOutcome::kTotalFailure:
      return CYCLE_OUTCOME_TOTAL_FAILURE;
  }
  return CYCLE_OUTCOME_UNSPECIFIED;
}

} // namespace

StatusService::StatusService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GatewayStatus StatusService::GetStatus(const GetStatusRequest&) {
  GatewayStatus resp;

  const auto link = ctx_.link->Status();
  auto*      l    = resp.mutable_device_link();
  l->set_endpoint(link.endpoint);
  l->set_state(ToProto(link.state));
  l->set_consecutive_errors(link.consecutive_errors);
  l->set_connect_count(link.connect_count);
  l->set_error_count(link.error_count);
  l->set_last_error(link.last_error);
  if (const auto tp = link.last_connect_time) *l->mutable_last_connect_time() = util::ToProto(*tp);
  if (const auto tp = link.last_read_time) *l->mutable_last_read_time() = util::ToProto(*tp);

  const auto poll = ctx_.poll->Stats();
  auto*      p    = resp.mutable_polling();
  p->set_running(poll.running);
  p->set_total_cycles(poll.total_cycles);
  p->set_failed_cycles(poll.failed_cycles);
  if (poll.last_outcome) p->set_last_outcome(ToProto(*poll.last_outcome));
  if (const auto tp = poll.last_cycle_time) *p->mutable_last_cycle_time() = util::ToProto(*tp);

  const auto batch = ctx_.batch->Stats();
  auto*      d     = resp.mutable_delivery();
  d->set_pending_points(batch.pending_points);
  d->set_pending_cycles(batch.pending_cycles);
  d->set_written_points(batch.written_points);
  d->set_failed_points(batch.failed_points);
  if (const auto tp = batch.last_successful_flush) *d->mutable_last_successful_flush() = util::ToProto(*tp);
  d->set_overflow_depth(ctx_.overflow->Depth());
  d->set_overflow_evicted(ctx_.overflow->EvictedCount());
  d->set_replayed_points(ctx_.overflow->ReplayedCount());
  if (const auto tp = ctx_.overflow->LastReplay()) *d->mutable_last_replay() = util::ToProto(*tp);
  d->set_store_healthy(ctx_.store->Healthy());

  const auto hub = ctx_.hub->Stats();
  auto*      r   = resp.mutable_realtime();
  r->set_connections(hub.connections);
  r->set_realtime_subscribers(hub.realtime_subscribers);
  r->set_pushes(hub.pushes);

  resp.set_devices_in_snapshot(ctx_.snapshot->Size());
  if (const auto tp = ctx_.snapshot->LatestTimestamp()) *resp.mutable_latest_reading_time() = util::ToProto(*tp);

  return resp;
}

GetLatestResponse StatusService::GetLatest(const GetLatestRequest& req) {
  GetLatestResponse resp;

  if (!req.device_id().empty()) {
    auto reading = ctx_.snapshot->Get(req.device_id());
    if (!reading) throw util::NotFound("no reading for device " + req.device_id());
    *resp.add_readings() = std::move(*reading);
    return resp;
  }

  if (!req.device_type().empty()) {
    for (auto& reading : ctx_.snapshot->ByType(req.device_type())) {
      *resp.add_readings() = std::move(reading);
    }
    return resp;
  }

  for (auto& [_, reading] : ctx_.snapshot->GetAll()) {
    *resp.add_readings() = std::move(reading);
  }
  return resp;
}

ReconnectResponse StatusService::Reconnect(const ReconnectRequest&) {
  ReconnectResponse resp;

  // served at the start of the next poll cycle; nothing polls when stopped
  if (!ctx_.poll->Stats().running) {
    resp.set_scheduled(false);
    return resp;
  }

  ctx_.poll->RequestReconnect();
  FIELDGATE_LOG_INFO("device reconnect scheduled", {observability::StringField("route", "StatusService.Reconnect")});

  resp.set_scheduled(true);
  return resp;
}

} // namespace fieldgate::service
