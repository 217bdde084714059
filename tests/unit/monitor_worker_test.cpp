#include "internal/monitor/monitor_worker.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/unit/support/fake_browser.hpp"
#include "tests/unit/support/fake_site.hpp"
#include "tests/unit/support/recording_notifier.hpp"

namespace {

namespace fs = std::filesystem;

using slotwatch::browser::BrowserDriver;
using slotwatch::model::UserAppointmentSpec;
using slotwatch::monitor::CycleOutcome;
using slotwatch::monitor::MonitorWorker;
using slotwatch::monitor::WorkerContext;
using slotwatch::monitor::WorkerPhase;
using slotwatch::testing::FakeBrowser;
using slotwatch::testing::FakeSite;
using slotwatch::testing::RecordingNotifier;
using slotwatch::testing::SiteScript;

constexpr const char* kEmail = "a@example.com";

struct Fixture {
  explicit Fixture(const std::string& name, SiteScript script, slotwatch::notify::AlertSettings alert_settings = {}) {
    const auto dir = fs::temp_directory_path() / "slotwatch_monitor_worker_tests" / name;
    fs::remove_all(dir);

    context.states = std::make_shared<slotwatch::state::StateStore>(dir / "state");

    FakeSite site(std::move(script));
    auto     created  = browsers;
    auto     counter  = quits;
    auto     statuses = seen_statuses;
    auto     states   = context.states;
    context.sessions  = std::make_shared<slotwatch::browser::SessionRegistry>([=]() -> std::unique_ptr<BrowserDriver> {
      auto browser = std::make_unique<FakeBrowser>();
      site.Install(*browser);
      browser->quit_counter = counter;
      browser->on_navigate  = [statuses, states](FakeBrowser&, const std::string&) {
        if (auto state = states->Get(kEmail)) {
          statuses->push_back(state->status());
        }
      };
      created->push_back(browser.get());
      return browser;
    });

    slotwatch::debug::ArtifactSettings artifact_settings;
    artifact_settings.logs_dir = dir / "logs";

    context.alerts     = std::make_shared<slotwatch::notify::AlertPolicy>(notifier, alert_settings);
    context.artifacts  = std::make_shared<slotwatch::debug::ArtifactWriter>(artifact_settings);
    context.navigation = slotwatch::testing::TestNavigationOptions();
  }

  std::unique_ptr<MonitorWorker> MakeWorker(const std::function<void(UserAppointmentSpec&)>& adjust = nullptr) const {
    UserAppointmentSpec spec;
    spec.email      = kEmail;
    spec.password   = "secret";
    spec.location   = "Toronto";
    spec.start_date = "2026-11-01";
    spec.end_date   = "2026-11-30";
    spec.ivr_number = "111";
    if (adjust) {
      adjust(spec);
    }
    return std::make_unique<MonitorWorker>(spec, context);
  }

  slotwatch::v1::WorkerState State() const {
    return *context.states->Get(kEmail);
  }

  std::shared_ptr<RecordingNotifier> notifier = std::make_shared<RecordingNotifier>();

  // Raw pointers are valid only while the registry still holds the session.
  std::shared_ptr<std::vector<FakeBrowser*>> browsers = std::make_shared<std::vector<FakeBrowser*>>();
  std::shared_ptr<int>                       quits    = std::make_shared<int>(0);

  // Stored status each time the browser navigates.
  std::shared_ptr<std::vector<std::string>> seen_statuses = std::make_shared<std::vector<std::string>>();

  WorkerContext context;
};

SiteScript SlotsScript() {
  SiteScript script;
  script.dates                       = {"2026-11-02", "2026-11-15"};
  script.times_by_date["2026-11-02"] = {"09:00", "09:15"};
  script.times_by_date["2026-11-15"] = {"14:30"};
  return script;
}

bool WaitUntil(const std::function<bool()>& condition) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

void TestCycleWithSlotsNotifiesEachSlot() {
  Fixture f("slots", SlotsScript());
  auto    worker = f.MakeWorker();

  assert(worker->RunCycle() == CycleOutcome::kSlotsFound);

  const auto state = f.State();
  assert(state.status() == "available");
  assert(state.slot_available());
  assert(state.date_range() == "2026-11-02");
  assert(state.location() == "Toronto");
  assert(state.notes() == "Found available appointments: 3");
  assert(state.has_last_slot_found_at());
  assert(f.notifier->CountSubject("Available Appointment Found!") == 3);
}

void TestCycleWithoutSlots() {
  Fixture f("no_slots", SiteScript{});
  auto    worker = f.MakeWorker();

  assert(worker->RunCycle() == CycleOutcome::kNoSlots);
  const auto state = f.State();
  assert(state.status() == "unavailable");
  assert(!state.slot_available());
  assert(state.date_range() == "2026-11-01 ~ 2026-11-30");
  assert(state.notes() == "No available appointments found");
  assert(f.notifier->messages().empty());
}

void TestBusyCycleIsQuiet() {
  auto script         = SlotsScript();
  script.busy_on_date = "2026-11-02";
  Fixture f("busy", script);
  auto    worker = f.MakeWorker();

  assert(worker->RunCycle() == CycleOutcome::kBusy);
  const auto state = f.State();
  assert(state.status() == "busy");
  assert(state.notes() == "System busy; retrying in 300s");
  assert(f.notifier->messages().empty());
}

void TestFailedCycleRecordsErrorAndThrottlesMail() {
  SiteScript script;
  script.accept_credentials = false;
  Fixture f("failed", script);
  auto    worker = f.MakeWorker();

  assert(worker->RunCycle() == CycleOutcome::kFailed);
  assert(worker->phase() == WorkerPhase::kError);

  auto state = f.State();
  assert(state.status() == "error");
  assert(state.notes() == "Login failed; retrying in 60s");
  assert(f.notifier->CountSubject("slotwatch error") == 1);
  assert(f.notifier->messages().back().body.find("Error: Login failed") != std::string::npos);

  assert(worker->RunCycle() == CycleOutcome::kFailed);
  assert(f.notifier->CountSubject("slotwatch error") == 1);
}

void TestNextDelayFollowsOutcome() {
  Fixture f("delay", SiteScript{});
  f.context.schedule.check_interval       = std::chrono::seconds(300);
  f.context.schedule.error_retry_interval = std::chrono::seconds(60);
  auto worker                             = f.MakeWorker();

  assert(worker->NextDelay(CycleOutcome::kSlotsFound) == std::chrono::seconds(300));
  assert(worker->NextDelay(CycleOutcome::kNoSlots) == std::chrono::seconds(300));
  assert(worker->NextDelay(CycleOutcome::kBusy) == std::chrono::seconds(300));
  assert(worker->NextDelay(CycleOutcome::kFailed) == std::chrono::seconds(60));
}

void TestStartRunsUntilStopped() {
  Fixture f("lifecycle", SlotsScript());
  auto    worker = f.MakeWorker();

  worker->Start();
  assert(WaitUntil([&] { return worker->phase() == WorkerPhase::kWaiting && f.context.states->Get(kEmail)->status() == "available"; }));

  assert(f.notifier->CountSubject("slotwatch search started") == 1);

  worker->Stop("Monitoring stopped");
  assert(worker->phase() == WorkerPhase::kStopped);
  assert(f.State().status() == "stopped");
  assert(f.State().notes() == "Monitoring stopped");
  assert(f.browsers->size() == 1);
  assert(*f.quits == 1);

  // stopping twice is harmless
  worker->Stop("again");
  assert(f.State().notes() == "Monitoring stopped");
}

void TestInitialLoginFailureHalts() {
  SiteScript script;
  script.accept_credentials = false;
  Fixture f("halt", script);
  auto    worker = f.MakeWorker();

  worker->Start();
  assert(WaitUntil([&] { return worker->phase() == WorkerPhase::kStopped; }));

  assert(f.State().status() == "login_failed");
  assert(f.notifier->CountSubject("slotwatch stopped") == 1);
  assert(f.notifier->CountSubject("slotwatch error") == 0);

  // the halted worker does not keep its browser open
  assert(*f.quits == 1);
}

void TestMissingLoginFormHaltsWithLoginFailed() {
  SiteScript script;
  script.show_login_form = false;
  Fixture f("no_login_form", script);
  auto    worker = f.MakeWorker();

  worker->Start();
  assert(WaitUntil([&] { return worker->phase() == WorkerPhase::kStopped; }));

  assert(f.State().status() == "login_failed");
  assert(f.notifier->CountSubject("slotwatch stopped") == 1);
  assert(*f.quits == 1);
}

void TestCycleReportsCheckingBeforeResult() {
  Fixture f("checking", SiteScript{});
  auto    worker = f.MakeWorker([](UserAppointmentSpec& spec) {
    spec.start_date = "2024-03-20";
    spec.end_date   = "2024-12-31";
  });

  assert(worker->RunCycle() == CycleOutcome::kNoSlots);

  assert(!f.seen_statuses->empty());
  assert(f.seen_statuses->front() == "checking");
  assert(f.State().status() == "unavailable");
  assert(f.State().date_range() == "2024-03-20 ~ 2024-12-31");
  assert(f.State().location() == "Toronto");
}

void TestStaleSessionLogsInAgainOnNextCycle() {
  Fixture f("stale_session", SlotsScript());
  auto    worker = f.MakeWorker();
  assert(worker->RunCycle() == CycleOutcome::kSlotsFound);

  // the site dropped the session: reloading shows the sign-in form
  f.browsers->front()->on_refresh = [](FakeBrowser& b) { b.SetUrl(slotwatch::testing::kSignInUrl); };

  assert(worker->RunCycle() == CycleOutcome::kSlotsFound);
  assert(f.browsers->size() == 1);
  assert(f.browsers->front()->refreshes == 1);
  assert(f.State().status() == "available");
}

void TestAutoBookBooksFirstSlot() {
  Fixture f("auto_book", SlotsScript());
  auto    worker = f.MakeWorker([](UserAppointmentSpec& spec) { spec.auto_book = true; });

  assert(worker->RunCycle() == CycleOutcome::kSlotsFound);
  assert(worker->booked());

  const auto state = f.State();
  assert(state.status() == "available");
  assert(state.notes() == "Appointment booked for 2026-11-02 09:00");

  const auto& clicks = f.browsers->front()->clicks;
  assert(std::find(clicks.begin(), clicks.end(), "submit") != clicks.end());

  std::size_t booked_mails = 0;
  for (const auto& message : f.notifier->messages()) {
    booked_mails += message.body.find("AUTOMATICALLY BOOKED") != std::string::npos ? 1 : 0;
  }
  assert(booked_mails == 1);
  assert(f.notifier->CountSubject("Available Appointment Found!") == 3);
}

void TestAutoBookEndsMonitoring() {
  Fixture f("auto_book_lifecycle", SlotsScript());
  auto    worker = f.MakeWorker([](UserAppointmentSpec& spec) { spec.auto_book = true; });

  worker->Start();
  assert(WaitUntil([&] { return worker->phase() == WorkerPhase::kStopped; }));
  assert(worker->booked());
  assert(*f.quits == 1);
  assert(f.State().notes() == "Appointment booked for 2026-11-02 09:00");
}

void TestFailedBookingStillReportsSlots() {
  auto script           = SlotsScript();
  script.accept_booking = false;
  Fixture f("auto_book_failed", script);
  auto    worker = f.MakeWorker([](UserAppointmentSpec& spec) { spec.auto_book = true; });

  assert(worker->RunCycle() == CycleOutcome::kSlotsFound);
  assert(!worker->booked());
  assert(f.State().notes() == "Found available appointments: 3");
  assert(f.notifier->CountSubject("slotwatch error") == 1);
  assert(f.notifier->CountSubject("Available Appointment Found!") == 3);
}

void TestMissingCredentialsAreRejected() {
  Fixture f("invalid", SiteScript{});

  bool rejected = false;
  try {
    MonitorWorker worker(UserAppointmentSpec{}, f.context);
  } catch (const slotwatch::util::InitializationError&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestCycleWithSlotsNotifiesEachSlot();
  TestCycleWithoutSlots();
  TestBusyCycleIsQuiet();
  TestFailedCycleRecordsErrorAndThrottlesMail();
  TestNextDelayFollowsOutcome();
  TestStartRunsUntilStopped();
  TestInitialLoginFailureHalts();
  TestMissingLoginFormHaltsWithLoginFailed();
  TestCycleReportsCheckingBeforeResult();
  TestStaleSessionLogsInAgainOnNextCycle();
  TestAutoBookBooksFirstSlot();
  TestAutoBookEndsMonitoring();
  TestFailedBookingStillReportsSlots();
  TestMissingCredentialsAreRejected();

  std::cout << "slotwatch_unit_monitor_worker: pass\n";
  return 0;
}
