#include "monitor_server.hpp"

#include "grpc_error.hpp"

namespace slotwatch::grpc {

using namespace slotwatch::v1;

MonitorServer::MonitorServer(std::shared_ptr<slotwatch::service::MonitorService> svc) : service_(std::move(svc)) {
}

::grpc::Status MonitorServer::GetWorkerState(::grpc::ServerContext*, const GetWorkerStateRequest* req, GetWorkerStateResponse* resp) {
  try {
    *resp = service_->GetWorkerState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::ListWorkerStates(::grpc::ServerContext*, const ListWorkerStatesRequest* req, ListWorkerStatesResponse* resp) {
  try {
    *resp = service_->ListWorkerStates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status MonitorServer::StopWorker(::grpc::ServerContext*, const StopWorkerRequest* req, StopWorkerResponse* resp) {
  try {
    *resp = service_->StopWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace slotwatch::grpc
