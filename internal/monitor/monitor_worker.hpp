#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "internal/browser/session_registry.hpp"
#include "internal/debug/artifact_writer.hpp"
#include "internal/model/appointment.hpp"
#include "internal/navigation/login_flow.hpp"
#include "internal/navigation/navigation_options.hpp"
#include "internal/navigation/reschedule_navigator.hpp"
#include "internal/notify/alert_policy.hpp"
#include "internal/scanner/slot_scanner.hpp"
#include "internal/state/state_store.hpp"

namespace slotwatch::runtime::config {
class MonitoringConfig;
}

namespace slotwatch::monitor {

enum class WorkerPhase : std::uint8_t {
  kIdle     = 0,
  kStarting = 1,
  kChecking = 2,
  kWaiting  = 3,
  kError    = 4,
  kStopping = 5,
  kStopped  = 6,
};

constexpr std::string_view ToString(WorkerPhase phase) {
  switch (phase) {
    case WorkerPhase::kStarting:
      return "starting";
    case WorkerPhase::kChecking:
      return "checking";
    case WorkerPhase::kWaiting:
      return "waiting";
    case WorkerPhase::kError:
      return "error";
    case WorkerPhase::kStopping:
      return "stopping";
    case WorkerPhase::kStopped:
      return "stopped";
    case WorkerPhase::kIdle:
    default:
      return "idle";
  }
}

enum class CycleOutcome : std::uint8_t {
  kSlotsFound,
  kNoSlots,
  kBusy,
  kFailed,
};

constexpr std::string_view ToString(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::kSlotsFound:
      return "slots_found";
    case CycleOutcome::kNoSlots:
      return "no_slots";
    case CycleOutcome::kBusy:
      return "busy";
    case CycleOutcome::kFailed:
    default:
      return "failed";
  }
}

struct MonitorSchedule {
  std::chrono::milliseconds check_interval{std::chrono::seconds(300)};
  std::chrono::milliseconds error_retry_interval{std::chrono::seconds(60)};

  static MonitorSchedule FromConfig(const slotwatch::runtime::config::MonitoringConfig& config);
};

// Collaborators shared by every worker, plus the per-worker alert policy.
struct WorkerContext {
  std::shared_ptr<browser::SessionRegistry> sessions;
  std::shared_ptr<state::StateStore>        states;
  std::shared_ptr<notify::AlertPolicy>      alerts;
  std::shared_ptr<debug::ArtifactWriter>    artifacts;
  navigation::NavigationOptions             navigation;
  MonitorSchedule                           schedule;
};

/*
  One user's monitoring loop on its own thread.

    Idle -> Starting -> (Checking <-> Waiting) -> Stopping -> Stopped
                 \            |
                  \           v
                   \------> Error -> Waiting (retry) | Stopped (login failed at start)

  With auto_book set, the first slot found is booked and the loop ends after
  that cycle.

  A cycle never throws: failures are caught at the cycle boundary, recorded
  in the state store and answered with the error-retry wait. Stop is honored
  between cycles, between dates and during waits.
*/
class MonitorWorker {
 public:
  // Throws util::InitializationError when credentials are missing.
  MonitorWorker(model::UserAppointmentSpec spec, WorkerContext context);
  ~MonitorWorker();

  MonitorWorker(const MonitorWorker&)            = delete;
  MonitorWorker& operator=(const MonitorWorker&) = delete;

  void Start();

  // Ask the loop to finish; returns immediately.
  void RequestStop();

  // Stops the loop, marks the state "stopped" and releases the session.
  void Stop(const std::string& note = "Monitoring stopped");

  CycleOutcome              RunCycle();
  std::chrono::milliseconds NextDelay(CycleOutcome outcome) const;

  WorkerPhase phase() const {
    return phase_.load();
  }

  const model::UserAppointmentSpec& spec() const {
    return spec_;
  }

  const std::string& key() const {
    return key_;
  }

  // An automatic booking went through; the loop ends after that cycle.
  bool booked() const {
    return booked_.load();
  }

 private:
  enum class StartResult { kReady, kRetry, kHalt };

  void        Run();
  StartResult Initialize();
  void        Login(browser::BrowserDriver& driver);
  bool        WaitFor(std::chrono::milliseconds delay);
  void        CaptureDebug(browser::BrowserDriver& driver, const std::string& prefix);

  std::string RetryNote(std::string_view what, std::chrono::milliseconds delay) const;

  model::UserAppointmentSpec       spec_;
  std::string                      key_;
  WorkerContext                    context_;
  navigation::LoginFlow            login_flow_;
  navigation::RescheduleNavigator  navigator_;
  scanner::SlotScanner             scanner_;

  std::thread             thread_;
  std::atomic<WorkerPhase> phase_{WorkerPhase::kIdle};
  std::atomic<bool>       stop_requested_{false};
  std::atomic<bool>       stopped_{false};
  std::atomic<bool>       booked_{false};
  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
};

} // namespace slotwatch::monitor
