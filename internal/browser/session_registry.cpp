#include "internal/browser/session_registry.hpp"

#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace slotwatch::browser {

SessionRegistry::SessionRegistry(DriverFactory factory) : factory_(std::move(factory)) {
  if (!factory_) {
    throw util::InitializationError("session registry requires a driver factory");
  }
}

SessionRegistry::~SessionRegistry() {
  CloseAll();
}

std::shared_ptr<SessionRegistry::Slot> SessionRegistry::SlotFor(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto&           slot = slots_[key];
  if (!slot) {
    slot = std::make_shared<Slot>();
  }
  return slot;
}

bool SessionRegistry::IsResponsive(BrowserDriver& driver) {
  try {
    driver.CurrentUrl();
    return true;
  } catch (const std::exception& e) {
    SLOTWATCH_LOG_INFO("browser session probe failed", {observability::StringField("error", e.what())});
    return false;
  }
}

void SessionRegistry::QuitQuietly(BrowserDriver& driver, const std::string& key) {
  try {
    driver.Quit();
  } catch (const std::exception& e) {
    SLOTWATCH_LOG_WARN("browser session quit failed", {observability::StringField("key", key), observability::StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Acquire
// ------------------------------------------------------------

std::shared_ptr<BrowserDriver> SessionRegistry::Acquire(const std::string& key) {
  auto            slot = SlotFor(key);
  std::lock_guard lock(slot->mutex);

  if (slot->driver) {
    if (IsResponsive(*slot->driver)) {
      return slot->driver;
    }
    SLOTWATCH_LOG_INFO("replacing unresponsive browser session", {observability::StringField("key", key)});
    QuitQuietly(*slot->driver, key);
    slot->driver.reset();
  }

  std::shared_ptr<BrowserDriver> driver = factory_();
  if (!driver) {
    throw util::DriverError("driver factory returned no session");
  }
  slot->driver = std::move(driver);
  SLOTWATCH_LOG_DEBUG("browser session ready", {observability::StringField("key", key)});
  return slot->driver;
}

// ------------------------------------------------------------
// Close
// ------------------------------------------------------------

void SessionRegistry::Close(const std::string& key) {
  std::shared_ptr<Slot> slot;
  {
    std::lock_guard lock(mutex_);
    auto            it = slots_.find(key);
    if (it == slots_.end()) {
      return;
    }
    slot = it->second;
  }

  std::lock_guard lock(slot->mutex);
  if (slot->driver) {
    QuitQuietly(*slot->driver, key);
    slot->driver.reset();
  }
}

void SessionRegistry::CloseAll() {
  std::vector<std::string> keys;
  {
    std::lock_guard lock(mutex_);
    keys.reserve(slots_.size());
    for (const auto& [key, slot] : slots_) {
      keys.push_back(key);
    }
  }

  for (const auto& key : keys) {
    Close(key);
  }
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard lock(mutex_);
  std::size_t     live = 0;
  for (const auto& [key, slot] : slots_) {
    std::lock_guard slot_lock(slot->mutex);
    if (slot->driver) {
      ++live;
    }
  }
  return live;
}

} // namespace slotwatch::browser
