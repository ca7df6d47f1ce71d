#include "status_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace fieldgate::grpc {

using namespace fieldgate::admin::v1;

StatusServer::StatusServer(std::shared_ptr<fieldgate::service::StatusService> svc) : service_(std::move(svc)) {
}

::grpc::Status StatusServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GatewayStatus* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    FIELDGATE_LOG_ERROR("RPC failed", {observability::StringField("route", "StatusService.GetStatus"), observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::GetLatest(::grpc::ServerContext*, const GetLatestRequest* req, GetLatestResponse* resp) {
  try {
    *resp = service_->GetLatest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status StatusServer::Reconnect(::grpc::ServerContext*, const ReconnectRequest* req, ReconnectResponse* resp) {
  try {
    *resp = service_->Reconnect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fieldgate::grpc
