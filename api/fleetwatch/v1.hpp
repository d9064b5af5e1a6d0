#pragma once

#include "fleetwatch/v1/types.pb.h"

#include "fleetwatch/v1/monitor_service.pb.h"
#include "fleetwatch/v1/monitor_service.grpc.pb.h"
