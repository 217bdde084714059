#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/browser/browser_driver.hpp"

namespace slotwatch::browser {

/*
  Owns at most one live browser session per user key.

  Acquire is idempotent: a session that still answers a cheap read is
  reused, anything else is quit and replaced. Creation failures propagate
  to the caller. Calls for the same key are serialized; different keys
  proceed in parallel.
*/
class SessionRegistry {
 public:
  explicit SessionRegistry(DriverFactory factory);
  ~SessionRegistry();

  SessionRegistry(const SessionRegistry&)            = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  std::shared_ptr<BrowserDriver> Acquire(const std::string& key);

  void Close(const std::string& key);
  void CloseAll();

  std::size_t Size() const;

 private:
  struct Slot {
    std::mutex                     mutex;
    std::shared_ptr<BrowserDriver> driver;
  };

  std::shared_ptr<Slot> SlotFor(const std::string& key);

  static bool IsResponsive(BrowserDriver& driver);
  static void QuitQuietly(BrowserDriver& driver, const std::string& key);

  DriverFactory factory_;

  mutable std::mutex                                     mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace slotwatch::browser
