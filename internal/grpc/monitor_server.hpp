#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/monitor_service.hpp"
#include "slotwatch/v1/monitor_service.grpc.pb.h"

namespace slotwatch::grpc {

class MonitorServer final : public slotwatch::v1::MonitorService::Service {
 public:
  explicit MonitorServer(std::shared_ptr<slotwatch::service::MonitorService> svc);

  ::grpc::Status GetWorkerState(::grpc::ServerContext*, const slotwatch::v1::GetWorkerStateRequest*, slotwatch::v1::GetWorkerStateResponse*) override;

  ::grpc::Status ListWorkerStates(::grpc::ServerContext*, const slotwatch::v1::ListWorkerStatesRequest*,
                                  slotwatch::v1::ListWorkerStatesResponse*) override;

  ::grpc::Status StopWorker(::grpc::ServerContext*, const slotwatch::v1::StopWorkerRequest*, slotwatch::v1::StopWorkerResponse*) override;

 private:
  std::shared_ptr<slotwatch::service::MonitorService> service_;
};

} // namespace slotwatch::grpc
