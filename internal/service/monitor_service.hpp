#pragma once

#include "internal/service/service_context.hpp"
#include "slotwatch/v1/monitor_service.pb.h"

namespace slotwatch::service {

/*
  Read-mostly view of the workers for operators. Unknown users raise
  util::NotFound.
*/
class MonitorService {
 public:
  explicit MonitorService(ServiceContext ctx);

  slotwatch::v1::GetWorkerStateResponse   GetWorkerState(const slotwatch::v1::GetWorkerStateRequest& req);
  slotwatch::v1::ListWorkerStatesResponse ListWorkerStates(const slotwatch::v1::ListWorkerStatesRequest& req);
  slotwatch::v1::StopWorkerResponse       StopWorker(const slotwatch::v1::StopWorkerRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace slotwatch::service
