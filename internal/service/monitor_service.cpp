#include "monitor_service.hpp"

#include <chrono>
#include <string>
#include <utility>

#include "internal/monitor/monitor_supervisor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"

namespace slotwatch::service {

using namespace slotwatch::v1;

namespace {

template <typename Fn>
auto Traced(const char* route, Fn&& fn) -> decltype(fn()) {
  slotwatch::observability::SpanScope span(route);
  try {
    return fn();
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SLOTWATCH_LOG_ERROR("RPC failed", {slotwatch::observability::StringField("route", route), slotwatch::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

MonitorService::MonitorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetWorkerStateResponse MonitorService::GetWorkerState(const GetWorkerStateRequest& req) {
  return Traced("MonitorService.GetWorkerState", [&] {
    auto* worker = ctx_.supervisor->Find(req.email());
    auto  state  = ctx_.states->Get(req.email());
    if (!worker && !state) {
      throw util::NotFound("no worker for " + req.email());
    }

    GetWorkerStateResponse resp;
    if (state) {
      *resp.mutable_state() = *state;
    }
    resp.set_phase(worker ? std::string(monitor::ToString(worker->phase())) : "unmanaged");
    return resp;
  });
}

ListWorkerStatesResponse MonitorService::ListWorkerStates(const ListWorkerStatesRequest&) {
  return Traced("MonitorService.ListWorkerStates", [&] {
    ListWorkerStatesResponse resp;
    for (auto& state : ctx_.states->List()) {
      *resp.add_states() = std::move(state);
    }
    return resp;
  });
}

StopWorkerResponse MonitorService::StopWorker(const StopWorkerRequest& req) {
  return Traced("MonitorService.StopWorker", [&] {
    auto* worker = ctx_.supervisor->Find(req.email());
    if (!worker) {
      throw util::NotFound("no worker for " + req.email());
    }

    SLOTWATCH_LOG_INFO("stopping worker on request", {slotwatch::observability::StringField("user", req.email())});
    worker->Stop("Stopped by operator");

    StopWorkerResponse resp;
    if (auto state = ctx_.states->Get(req.email())) {
      *resp.mutable_state() = *state;
    }
    return resp;
  });
}

} // namespace slotwatch::service
