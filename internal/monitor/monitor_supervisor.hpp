#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/monitor/monitor_worker.hpp"

namespace slotwatch::monitor {

/*
  Owns one worker per configured user.
*/
class MonitorSupervisor {
 public:
  // Throws util::InitializationError when there is no worker.
  explicit MonitorSupervisor(std::vector<std::unique_ptr<MonitorWorker>> workers);
  ~MonitorSupervisor();

  void StartAll();

  // Signals every worker first, then stops them one by one.
  void Shutdown(const std::string& note = "Monitoring stopped");

  MonitorWorker* Find(const std::string& email) const;

  std::size_t size() const {
    return workers_.size();
  }

  const std::vector<std::unique_ptr<MonitorWorker>>& workers() const {
    return workers_;
  }

 private:
  std::vector<std::unique_ptr<MonitorWorker>> workers_;
};

} // namespace slotwatch::monitor
