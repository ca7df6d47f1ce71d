#pragma once

#include "fieldgate/admin/v1/status.pb.h"
#include "service_context.hpp"

namespace fieldgate::service {

class StatusService {
 public:
  explicit StatusService(ServiceContext ctx);

  fieldgate::admin::v1::GatewayStatus GetStatus(const fieldgate::admin::v1::GetStatusRequest& req);

  fieldgate::admin::v1::GetLatestResponse GetLatest(const fieldgate::admin::v1::GetLatestRequest& req);

  // Queued for the poll scheduler; the link itself is never touched here.
  fieldgate::admin::v1::ReconnectResponse Reconnect(const fieldgate::admin::v1::ReconnectRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace fieldgate::service
