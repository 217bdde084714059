#include "internal/monitor/monitor_worker.hpp"

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identity.hpp"

namespace slotwatch::monitor {

using model::WorkerStatus;
using observability::IntField;
using observability::StringField;

namespace {

navigation::PageMarkers MarkersFor(const navigation::NavigationOptions& options) {
  return navigation::PageMarkers(options.busy_markers, options.login_markers, options.sign_in_path);
}

// Short user-facing phrase for a failed cycle. Exception text stays in the logs.
std::string FailureContext(const std::exception& e) {
  if (dynamic_cast<const util::LoginFailed*>(&e)) {
    return "Login failed";
  }
  if (dynamic_cast<const util::SessionExpired*>(&e)) {
    return "Session expired";
  }
  if (dynamic_cast<const util::NavigationFailed*>(&e) || dynamic_cast<const util::ElementNotFound*>(&e)) {
    return "Could not reach the reschedule page";
  }
  if (dynamic_cast<const util::DriverError*>(&e)) {
    return "Browser session error";
  }
  return "Error checking available dates";
}

} // namespace

MonitorSchedule MonitorSchedule::FromConfig(const slotwatch::runtime::config::MonitoringConfig& config) {
  MonitorSchedule schedule;
  if (config.check_interval_seconds() > 0) {
    schedule.check_interval = std::chrono::seconds(config.check_interval_seconds());
  }
  if (config.error_retry_interval_seconds() > 0) {
    schedule.error_retry_interval = std::chrono::seconds(config.error_retry_interval_seconds());
  }
  return schedule;
}

MonitorWorker::MonitorWorker(model::UserAppointmentSpec spec, WorkerContext context)
    : spec_(std::move(spec)),
      key_(util::StableKey(spec_.email)),
      context_(std::move(context)),
      login_flow_(context_.navigation),
      navigator_(context_.navigation, MarkersFor(context_.navigation), [this](browser::BrowserDriver& driver) { Login(driver); }),
      scanner_(context_.navigation, MarkersFor(context_.navigation)) {
  if (spec_.email.empty() || spec_.password.empty()) {
    throw util::InitializationError("user configuration requires email and password");
  }
  if (!context_.sessions || !context_.states || !context_.alerts || !context_.artifacts) {
    throw util::InitializationError("monitor worker is missing a collaborator");
  }
}

MonitorWorker::~MonitorWorker() {
  RequestStop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void MonitorWorker::Start() {
  if (thread_.joinable() || stop_requested_) {
    return;
  }
  thread_ = std::thread(&MonitorWorker::Run, this);
}

void MonitorWorker::RequestStop() {
  {
    std::lock_guard lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
}

void MonitorWorker::Stop(const std::string& note) {
  if (stopped_.exchange(true)) {
    return;
  }

  phase_ = WorkerPhase::kStopping;
  RequestStop();
  if (thread_.joinable()) {
    thread_.join();
  }

  context_.states->Update(spec_.email, WorkerStatus::kStopped, spec_.DateRangeDisplay(), spec_.EffectiveLocation(), false, note);
  context_.sessions->Close(key_);

  phase_ = WorkerPhase::kStopped;
  SLOTWATCH_LOG_INFO("monitor stopped", {StringField("user", spec_.email)});
}

void MonitorWorker::Run() {
  SLOTWATCH_LOG_INFO("monitor starting", {StringField("user", spec_.email), StringField("location", spec_.EffectiveLocation()),
                                          StringField("date_range", spec_.DateRangeDisplay())});

  const auto start = Initialize();
  if (start == StartResult::kHalt) {
    phase_ = WorkerPhase::kStopped;
    return;
  }
  if (start == StartResult::kRetry && !WaitFor(context_.schedule.error_retry_interval)) {
    return;
  }

  while (!stop_requested_) {
    const auto outcome = RunCycle();
    if (booked_) {
      SLOTWATCH_LOG_INFO("appointment booked, monitor finished", {StringField("user", spec_.email)});
      context_.sessions->Close(key_);
      phase_ = WorkerPhase::kStopped;
      return;
    }
    if (!WaitFor(NextDelay(outcome))) {
      break;
    }
  }
}

MonitorWorker::StartResult MonitorWorker::Initialize() {
  phase_ = WorkerPhase::kStarting;
  context_.states->Update(spec_.email, WorkerStatus::kStarting, spec_.DateRangeDisplay(), spec_.EffectiveLocation(), false, "Monitoring started");
  context_.alerts->NotifyStartup(spec_);

  std::shared_ptr<browser::BrowserDriver> driver;
  try {
    driver = context_.sessions->Acquire(key_);
    Login(*driver);
    return StartResult::kReady;
  } catch (const util::LoginFailed& e) {
    phase_ = WorkerPhase::kError;
    SLOTWATCH_LOG_ERROR("initial login failed, monitor halted", {StringField("user", spec_.email), StringField("error", e.what())});
    if (driver) {
      CaptureDebug(*driver, "login_error");
    }
    context_.alerts->NotifyFatal(spec_, "Login failed");
    context_.sessions->Close(key_);
    return StartResult::kHalt;
  } catch (const std::exception& e) {
    phase_ = WorkerPhase::kError;
    SLOTWATCH_LOG_ERROR("browser session unavailable at start", {StringField("user", spec_.email), StringField("error", e.what())});
    context_.states->Update(spec_.email, WorkerStatus::kError, spec_.DateRangeDisplay(), spec_.EffectiveLocation(), false,
                            RetryNote("Browser session unavailable", context_.schedule.error_retry_interval));
    return StartResult::kRetry;
  }
}

void MonitorWorker::Login(browser::BrowserDriver& driver) {
  try {
    login_flow_.Login(driver, spec_.email, spec_.password);
  } catch (const util::LoginFailed&) {
    context_.states->UpdateLoginState(spec_.email, false);
    throw;
  }
  context_.states->UpdateLoginState(spec_.email, true);
}

bool MonitorWorker::WaitFor(std::chrono::milliseconds delay) {
  if (!stop_requested_) {
    phase_ = WorkerPhase::kWaiting;
  }
  SLOTWATCH_LOG_DEBUG("waiting for next cycle", {StringField("user", spec_.email), IntField("delay_ms", delay.count())});

  std::unique_lock lock(wait_mutex_);
  return !wait_cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

std::chrono::milliseconds MonitorWorker::NextDelay(CycleOutcome outcome) const {
  return outcome == CycleOutcome::kFailed ? context_.schedule.error_retry_interval : context_.schedule.check_interval;
}

std::string MonitorWorker::RetryNote(std::string_view what, std::chrono::milliseconds delay) const {
  return std::string(what) + "; retrying in " + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(delay).count()) + "s";
}

void MonitorWorker::CaptureDebug(browser::BrowserDriver& driver, const std::string& prefix) {
  auto artifact = context_.artifacts->Capture(driver, prefix);
  context_.alerts->NotifyDebug(artifact);
}

// ------------------------------------------------------------
// Cycle
// ------------------------------------------------------------

CycleOutcome MonitorWorker::RunCycle() {
  observability::SpanScope span("monitor.cycle");
  span.SetAttribute("user.key", key_);

  const auto started  = std::chrono::steady_clock::now();
  const auto range    = spec_.DateRangeDisplay();
  const auto location = spec_.EffectiveLocation();

  phase_ = WorkerPhase::kChecking;
  context_.states->Update(spec_.email, WorkerStatus::kChecking, range, location, false, "Checking for available appointments");

  CycleOutcome                            outcome = CycleOutcome::kFailed;
  std::shared_ptr<browser::BrowserDriver> driver;
  try {
    driver = context_.sessions->Acquire(key_);
    navigator_.NavigateToReschedule(*driver, spec_.ivr_number);

    auto scan = scanner_.Scan(*driver, spec_, [this] { return stop_requested_.load(); });

    if (!scan.slots.empty()) {
      auto& first = scan.slots.front();
      auto  notes = "Found available appointments: " + std::to_string(scan.slots.size());
      if (spec_.auto_book && !booked_) {
        if (scanner_.Book(*driver, first)) {
          first.auto_booked = true;
          booked_           = true;
          notes             = "Appointment booked for " + first.date + " " + first.time;
        } else {
          context_.alerts->NotifyError(spec_, "Automatic booking failed");
        }
      }

      for (const auto& slot : scan.slots) {
        context_.alerts->NotifySlot(spec_, slot);
      }
      context_.states->Update(spec_.email, WorkerStatus::kAvailable, first.date, first.city, true, notes);
      outcome = CycleOutcome::kSlotsFound;
    } else if (scan.busy) {
      CaptureDebug(*driver, "system_busy");
      context_.states->Update(spec_.email, WorkerStatus::kBusy, range, location, false,
                              RetryNote("System busy", NextDelay(CycleOutcome::kBusy)));
      outcome = CycleOutcome::kBusy;
    } else {
      context_.states->Update(spec_.email, WorkerStatus::kUnavailable, range, location, false, "No available appointments found");
      outcome = CycleOutcome::kNoSlots;
    }
  } catch (const std::exception& e) {
    phase_ = WorkerPhase::kError;
    span.RecordException(e.what());
    SLOTWATCH_LOG_ERROR("monitor cycle failed", {StringField("user", spec_.email), StringField("error", e.what())});

    const auto context = FailureContext(e);
    if (driver) {
      CaptureDebug(*driver, "monitor_error");
    }
    context_.alerts->NotifyError(spec_, context);
    context_.states->Update(spec_.email, WorkerStatus::kError, range, location, false,
                            RetryNote(context, NextDelay(CycleOutcome::kFailed)));
    outcome = CycleOutcome::kFailed;
  }

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().RecordCycle(ToString(outcome));
  observability::Metrics::Instance().ObserveCycleDurationMs(elapsed_ms);
  span.SetAttribute("outcome", ToString(outcome));

  SLOTWATCH_LOG_INFO("monitor cycle finished", {StringField("user", spec_.email), StringField("outcome", ToString(outcome)),
                                                IntField("duration_ms", static_cast<std::int64_t>(elapsed_ms))});
  return outcome;
}

} // namespace slotwatch::monitor
