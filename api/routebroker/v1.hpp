#pragma once

#include "routebroker/v1/mesh.pb.h"
#include "routebroker/v1/route.pb.h"

#include "routebroker/services/v1/mesh_admin_service.pb.h"
#include "routebroker/services/v1/route_service.pb.h"

#include "routebroker/services/v1/mesh_admin_service.grpc.pb.h"
#include "routebroker/services/v1/route_service.grpc.pb.h"

namespace routebroker::v1 {
using namespace ::routebroker::services::v1;
}
