#pragma once

#include "fieldgate/core/v1/point.pb.h"
#include "fieldgate/core/v1/reading.pb.h"

#include "fieldgate/realtime/v1/messages.pb.h"

#include "fieldgate/admin/v1/status.pb.h"

#include "fieldgate/services/v1/realtime_service.pb.h"
#include "fieldgate/services/v1/status_service.pb.h"

#include "fieldgate/services/v1/realtime_service.grpc.pb.h"
#include "fieldgate/services/v1/status_service.grpc.pb.h"

namespace fieldgate::v1 {
using namespace ::fieldgate::core::v1;
using namespace ::fieldgate::realtime::v1;
using namespace ::fieldgate::admin::v1;
using namespace ::fieldgate::services::v1;
}
