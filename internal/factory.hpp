#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/browser/browser_driver.hpp"
#include "internal/browser/session_registry.hpp"
#include "internal/debug/artifact_writer.hpp"
#include "internal/monitor/monitor_supervisor.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/state/state_store.hpp"

namespace slotwatch::factory {

/*
  Application

  Owns all long-lived objects of the daemon. Everything here lives for the
  lifetime of the process.
*/
struct Application {
  std::shared_ptr<browser::SessionRegistry>      sessions;
  std::shared_ptr<state::StateStore>             states;
  std::shared_ptr<notify::Notifier>              notifier;
  std::shared_ptr<debug::ArtifactWriter>         artifacts;
  std::shared_ptr<monitor::MonitorSupervisor>    supervisor;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Overrides for the outer edges; empty members select the real implementations.
struct Overrides {
  browser::DriverFactory            driver_factory;
  std::shared_ptr<notify::Notifier> notifier;
};

/*
  Build

  Composition root: the only place that knows the concrete browser driver
  and mail transport. Throws util::InitializationError when there is no
  user or a directory cannot be created.
*/
Application Build(const slotwatch::runtime::config::RuntimeConfig& config, Overrides overrides = {});

} // namespace slotwatch::factory
