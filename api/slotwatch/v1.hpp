#pragma once

#include "slotwatch/v1/worker_state.pb.h"

#include "slotwatch/v1/monitor_service.pb.h"

#include "slotwatch/v1/monitor_service.grpc.pb.h"
