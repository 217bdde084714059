#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/grpc/monitor_server.hpp"
#include "internal/service/monitor_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "slotwatch/v1.hpp"
#include "tests/unit/support/fake_browser.hpp"
#include "tests/unit/support/fake_site.hpp"
#include "tests/unit/support/recording_notifier.hpp"

namespace {

namespace fs = std::filesystem;

using slotwatch::browser::BrowserDriver;
using slotwatch::runtime::config::RuntimeConfig;
using slotwatch::testing::FakeBrowser;
using slotwatch::testing::FakeSite;
using slotwatch::testing::RecordingNotifier;
using slotwatch::testing::SiteScript;

RuntimeConfig MakeConfig(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "slotwatch_monitor_server_tests" / name;
  fs::remove_all(dir);

  RuntimeConfig config;
  config.mutable_storage()->set_state_dir((dir / "state").string());
  config.mutable_storage()->set_logs_dir((dir / "logs").string());
  config.mutable_site()->set_base_url(slotwatch::testing::kBaseUrl);

  auto* navigation = config.mutable_navigation();
  navigation->set_element_wait_ms(30);
  navigation->set_page_wait_ms(60);
  navigation->set_card_wait_ms(30);
  navigation->set_login_redirect_wait_ms(60);
  navigation->set_settle_delay_ms(1);
  navigation->set_post_click_delay_ms(1);
  navigation->set_poll_interval_ms(5);

  auto& user = (*config.mutable_users())["a@example.com"];
  user.set_password("secret");
  user.mutable_appointment()->set_location("Toronto");
  user.mutable_appointment()->set_ivr_number("111");
  return config;
}

slotwatch::factory::Overrides FakeEdges(std::shared_ptr<RecordingNotifier> notifier) {
  slotwatch::factory::Overrides overrides;
  FakeSite                      site(SiteScript{});
  overrides.driver_factory = [site]() -> std::unique_ptr<BrowserDriver> {
    auto browser = std::make_unique<FakeBrowser>();
    site.Install(*browser);
    return browser;
  };
  overrides.notifier = std::move(notifier);
  return overrides;
}

slotwatch::grpc::MonitorServer MakeServer(const slotwatch::factory::Application& app) {
  slotwatch::service::ServiceContext ctx;
  ctx.supervisor = app.supervisor;
  ctx.states     = app.states;
  return slotwatch::grpc::MonitorServer(std::make_shared<slotwatch::service::MonitorService>(ctx));
}

void TestBuildWiresOneWorkerPerUser() {
  auto app = slotwatch::factory::Build(MakeConfig("build"), FakeEdges(std::make_shared<RecordingNotifier>()));

  assert(app.supervisor->size() == 1);
  assert(app.supervisor->Find("a@example.com") != nullptr);
  assert(app.supervisor->Find("b@example.com") == nullptr);
  assert(app.grpc_services.size() == 1);
}

void TestBuildWithoutUsersFails() {
  auto config = MakeConfig("no_users");
  config.mutable_users()->clear();

  bool failed = false;
  try {
    slotwatch::factory::Build(config, FakeEdges(std::make_shared<RecordingNotifier>()));
  } catch (const slotwatch::util::InitializationError&) {
    failed = true;
  }
  assert(failed);
}

void TestUnknownUserReturnsNotFound() {
  auto app    = slotwatch::factory::Build(MakeConfig("not_found"), FakeEdges(std::make_shared<RecordingNotifier>()));
  auto server = MakeServer(app);

  slotwatch::v1::GetWorkerStateRequest req;
  req.set_email("nobody@example.com");
  slotwatch::v1::GetWorkerStateResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  assert(server.GetWorkerState(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  slotwatch::v1::StopWorkerRequest  stop_req;
  slotwatch::v1::StopWorkerResponse stop_resp;
  stop_req.set_email("nobody@example.com");
  assert(server.StopWorker(&grpc_ctx, &stop_req, &stop_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestIdleWorkerIsReported() {
  auto app    = slotwatch::factory::Build(MakeConfig("idle"), FakeEdges(std::make_shared<RecordingNotifier>()));
  auto server = MakeServer(app);

  slotwatch::v1::GetWorkerStateRequest req;
  req.set_email("a@example.com");
  slotwatch::v1::GetWorkerStateResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  assert(server.GetWorkerState(&grpc_ctx, &req, &resp).ok());
  assert(resp.phase() == "idle");
  assert(!resp.has_state());
}

void TestStopWorkerMarksStopped() {
  auto notifier = std::make_shared<RecordingNotifier>();
  auto app      = slotwatch::factory::Build(MakeConfig("stop"), FakeEdges(notifier));
  auto server   = MakeServer(app);

  app.supervisor->StartAll();

  slotwatch::v1::StopWorkerRequest req;
  req.set_email("a@example.com");
  slotwatch::v1::StopWorkerResponse resp;
  ::grpc::ServerContext             grpc_ctx;

  assert(server.StopWorker(&grpc_ctx, &req, &resp).ok());
  assert(resp.state().status() == "stopped");
  assert(resp.state().notes() == "Stopped by operator");

  slotwatch::v1::ListWorkerStatesRequest  list_req;
  slotwatch::v1::ListWorkerStatesResponse list_resp;
  assert(server.ListWorkerStates(&grpc_ctx, &list_req, &list_resp).ok());
  assert(list_resp.states_size() == 1);
  assert(list_resp.states(0).email() == "a@example.com");

  // shutdown after an explicit stop keeps the operator note
  app.supervisor->Shutdown();
  assert(app.states->Get("a@example.com")->notes() == "Stopped by operator");
}

} // namespace

int main() {
  TestBuildWiresOneWorkerPerUser();
  TestBuildWithoutUsersFails();
  TestUnknownUserReturnsNotFound();
  TestIdleWorkerIsReported();
  TestStopWorkerMarksStopped();

  std::cout << "slotwatch_unit_monitor_server: pass\n";
  return 0;
}
