#include "factory.hpp"

#include <utility>

#include "internal/browser/webdriver_client.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/grpc/monitor_server.hpp"
#include "internal/model/appointment.hpp"
#include "internal/monitor/monitor_worker.hpp"
#include "internal/navigation/navigation_options.hpp"
#include "internal/notify/alert_policy.hpp"
#include "internal/notify/smtp_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/monitor_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace slotwatch::factory {

/*
    Build full application dependency graph
*/
Application Build(const slotwatch::runtime::config::RuntimeConfig& config, Overrides overrides) {
  auto cfg = config;
  slotwatch::config::ConfigLoader::ApplyDefaults(cfg);

  if (cfg.users().empty()) {
    throw util::InitializationError("no user configuration found");
  }

  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.states    = std::make_shared<state::StateStore>(cfg.storage().state_dir());
  app.artifacts = std::make_shared<debug::ArtifactWriter>(debug::ArtifactSettings::FromConfig(cfg));

  // ------------------------------------------------------------------
  // Outer edges: browser sessions and mail
  // ------------------------------------------------------------------
  auto driver_factory = std::move(overrides.driver_factory);
  if (!driver_factory) {
    auto options   = browser::WebDriverOptions::FromConfig(cfg.browser());
    driver_factory = [options]() -> std::unique_ptr<browser::BrowserDriver> { return std::make_unique<browser::WebDriverClient>(options); };
  }
  app.sessions = std::make_shared<browser::SessionRegistry>(std::move(driver_factory));

  app.notifier = overrides.notifier;
  if (!app.notifier) {
    app.notifier = std::make_shared<notify::SmtpNotifier>(notify::SmtpSettings::FromConfig(cfg.notification().gmail()));
  }

  // ------------------------------------------------------------------
  // Workers, one per configured user
  // ------------------------------------------------------------------
  const auto nav_options = navigation::NavigationOptions::FromConfig(cfg);
  const auto schedule   = monitor::MonitorSchedule::FromConfig(cfg.monitoring());
  const auto alerts     = notify::AlertSettings::FromConfig(cfg.debug());

  std::vector<std::unique_ptr<monitor::MonitorWorker>> workers;
  for (const auto& entry : cfg.users()) {
    const auto& user = entry.second;
    monitor::WorkerContext context;
    context.sessions   = app.sessions;
    context.states     = app.states;
    context.alerts     = std::make_shared<notify::AlertPolicy>(app.notifier, alerts);
    context.artifacts  = app.artifacts;
    context.navigation = nav_options;
    context.schedule   = schedule;

    workers.push_back(std::make_unique<monitor::MonitorWorker>(model::UserAppointmentSpec::FromConfig(user), std::move(context)));
    SLOTWATCH_LOG_INFO("worker configured", {observability::StringField("user", user.email())});
  }
  app.supervisor = std::make_shared<monitor::MonitorSupervisor>(std::move(workers));

  // ------------------------------------------------------------------
  // Admin service
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.supervisor = app.supervisor;
  ctx.states     = app.states;

  auto monitor_service = std::make_shared<service::MonitorService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::MonitorServer>(monitor_service));

  return app;
}

} // namespace slotwatch::factory
