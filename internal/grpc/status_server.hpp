#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "fieldgate/services/v1/status_service.grpc.pb.h"
#include "internal/service/status_service.hpp"

namespace fieldgate::grpc {

class StatusServer final : public fieldgate::services::v1::StatusService::Service {
 public:
  explicit StatusServer(std::shared_ptr<fieldgate::service::StatusService> svc);

  ::grpc::Status GetStatus(::grpc::ServerContext*, const fieldgate::admin::v1::GetStatusRequest*, fieldgate::admin::v1::GatewayStatus*) override;

  ::grpc::Status GetLatest(::grpc::ServerContext*, const fieldgate::admin::v1::GetLatestRequest*, fieldgate::admin::v1::GetLatestResponse*) override;

  ::grpc::Status Reconnect(::grpc::ServerContext*, const fieldgate::admin::v1::ReconnectRequest*, fieldgate::admin::v1::ReconnectResponse*) override;

 private:
  std::shared_ptr<fieldgate::service::StatusService> service_;
};

} // namespace fieldgate::grpc
