#pragma once

#include <memory>

namespace slotwatch::monitor {
class MonitorSupervisor;
}
namespace slotwatch::state {
class StateStore;
}

namespace slotwatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<slotwatch::monitor::MonitorSupervisor> supervisor;
  std::shared_ptr<slotwatch::state::StateStore>          states;
};

} // namespace slotwatch::service
