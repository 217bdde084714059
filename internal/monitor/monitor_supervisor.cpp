#include "internal/monitor/monitor_supervisor.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace slotwatch::monitor {

MonitorSupervisor::MonitorSupervisor(std::vector<std::unique_ptr<MonitorWorker>> workers) : workers_(std::move(workers)) {
  if (workers_.empty()) {
    throw util::InitializationError("no user configuration found");
  }
}

MonitorSupervisor::~MonitorSupervisor() {
  for (auto& worker : workers_) {
    worker->RequestStop();
  }
}

void MonitorSupervisor::StartAll() {
  for (auto& worker : workers_) {
    worker->Start();
  }
  SLOTWATCH_LOG_INFO("monitors started", {observability::IntField("workers", static_cast<std::int64_t>(workers_.size()))});
}

void MonitorSupervisor::Shutdown(const std::string& note) {
  for (auto& worker : workers_) {
    worker->RequestStop();
  }
  for (auto& worker : workers_) {
    worker->Stop(note);
  }
}

MonitorWorker* MonitorSupervisor::Find(const std::string& email) const {
  for (const auto& worker : workers_) {
    if (worker->spec().email == email) {
      return worker.get();
    }
  }
  return nullptr;
}

} // namespace slotwatch::monitor
