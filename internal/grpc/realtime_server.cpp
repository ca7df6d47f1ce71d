#include "realtime_server.hpp"

#include "internal/broadcast/queued_connection.hpp"

namespace fieldgate::grpc {

using fieldgate::realtime::v1::ClientMessage;
using fieldgate::realtime::v1::ServerMessage;

namespace {

using Stream = ::grpc::ServerReaderWriter<ServerMessage, ClientMessage>;

// Valid only while Connect runs; QueuedConnection::Finish fences it.
class GrpcStreamSink final : public broadcast::StreamSink {
 public:
  GrpcStreamSink(::grpc::ServerContext* ctx, Stream* stream) : ctx_(ctx), stream_(stream), peer_(ctx->peer()) {
  }

  bool Write(const ServerMessage& message) override {
    return stream_->Write(message);
  }

  void Cancel() override {
    ctx_->TryCancel();
  }

  std::string Peer() const override {
    return peer_;
  }

 private:
  ::grpc::ServerContext* ctx_;
  Stream*                stream_;
  std::string            peer_;
};

} // namespace

RealtimeServer::RealtimeServer(std::shared_ptr<broadcast::BroadcastHub> hub, broadcast::QueueOptions queue)
    : hub_(std::move(hub)), queue_(queue) {
}

::grpc::Status RealtimeServer::Connect(::grpc::ServerContext* ctx, Stream* stream) {
  auto connection = std::make_shared<broadcast::QueuedConnection>(std::make_shared<GrpcStreamSink>(ctx, stream), queue_);
  auto id         = hub_->Connect(connection);

  ClientMessage msg;
  while (stream->Read(&msg)) {
    hub_->HandleMessage(id, msg);
    msg.Clear();
  }

  // no writes to the stream once this returns
  connection->Finish();
  hub_->Disconnect(id, "client closed");

  // server-side close (timeout, failed send) already happened if reason is set
  auto reason = connection->CloseReason();
  if (!reason.empty()) {
    return {::grpc::StatusCode::CANCELLED, reason};
  }
  return ::grpc::Status::OK;
}

} // namespace fieldgate::grpc
