#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "fieldgate/services/v1/realtime_service.grpc.pb.h"
#include "internal/broadcast/broadcast_hub.hpp"
#include "internal/broadcast/queued_connection.hpp"

namespace fieldgate::grpc {

/*
  RealtimeService.Connect: one bidi stream per subscriber.

  The handler thread reads client messages and feeds them to the hub. The
  hub's push and reaper threads only enqueue on a QueuedConnection, whose
  writer thread owns the stream's Write side until the handler returns.
*/
class RealtimeServer final : public fieldgate::services::v1::RealtimeService::Service {
 public:
  RealtimeServer(std::shared_ptr<fieldgate::broadcast::BroadcastHub> hub, fieldgate::broadcast::QueueOptions queue);

  ::grpc::Status Connect(::grpc::ServerContext* ctx,
                         ::grpc::ServerReaderWriter<fieldgate::realtime::v1::ServerMessage, fieldgate::realtime::v1::ClientMessage>* stream) override;

 private:
  std::shared_ptr<fieldgate::broadcast::BroadcastHub> hub_;
  fieldgate::broadcast::QueueOptions                  queue_;
};

} // namespace fieldgate::grpc
