#include "internal/browser/session_registry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/unit/support/fake_browser.hpp"

namespace {

using slotwatch::browser::BrowserDriver;
using slotwatch::browser::SessionRegistry;
using slotwatch::testing::FakeBrowser;

void TestAcquireReusesLiveSession() {
  int             created = 0;
  SessionRegistry registry([&created]() -> std::unique_ptr<BrowserDriver> {
    ++created;
    return std::make_unique<FakeBrowser>();
  });

  auto first  = registry.Acquire("user-a");
  auto second = registry.Acquire("user-a");
  assert(first == second);
  assert(created == 1);

  auto other = registry.Acquire("user-b");
  assert(other != first);
  assert(created == 2);
  assert(registry.Size() == 2);
}

void TestUnresponsiveSessionIsReplaced() {
  int             created = 0;
  SessionRegistry registry([&created]() -> std::unique_ptr<BrowserDriver> {
    ++created;
    return std::make_unique<FakeBrowser>();
  });

  auto stale = std::static_pointer_cast<FakeBrowser>(registry.Acquire("user-a"));
  stale->FailAll(true);

  auto fresh = registry.Acquire("user-a");
  assert(fresh != stale);
  assert(created == 2);
  assert(stale->quit_calls == 1);
  assert(registry.Size() == 1);
}

void TestCloseQuitsAndNextAcquireCreates() {
  int             created = 0;
  SessionRegistry registry([&created]() -> std::unique_ptr<BrowserDriver> {
    ++created;
    return std::make_unique<FakeBrowser>();
  });

  auto session = std::static_pointer_cast<FakeBrowser>(registry.Acquire("user-a"));
  registry.Close("user-a");
  registry.Close("unknown");
  assert(session->quit_calls == 1);
  assert(registry.Size() == 0);

  registry.Acquire("user-a");
  assert(created == 2);

  registry.CloseAll();
  assert(registry.Size() == 0);
}

void TestConcurrentAcquireCreatesOneSession() {
  std::atomic<int> created{0};
  SessionRegistry  registry([&created]() -> std::unique_ptr<BrowserDriver> {
    ++created;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    return std::make_unique<FakeBrowser>();
  });

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&registry] { registry.Acquire("user-a"); });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  assert(created == 1);
}

void TestFactoryFailures() {
  bool rejected = false;
  try {
    SessionRegistry registry{slotwatch::browser::DriverFactory{}};
  } catch (const slotwatch::util::InitializationError&) {
    rejected = true;
  }
  assert(rejected);

  SessionRegistry registry([]() -> std::unique_ptr<BrowserDriver> { return nullptr; });
  bool            failed = false;
  try {
    registry.Acquire("user-a");
  } catch (const slotwatch::util::DriverError&) {
    failed = true;
  }
  assert(failed);
  assert(registry.Size() == 0);

  SessionRegistry throwing([]() -> std::unique_ptr<BrowserDriver> { throw slotwatch::util::DriverError("chromedriver not running"); });
  failed = false;
  try {
    throwing.Acquire("user-a");
  } catch (const slotwatch::util::DriverError&) {
    failed = true;
  }
  assert(failed);
}

} // namespace

int main() {
  TestAcquireReusesLiveSession();
  TestUnresponsiveSessionIsReplaced();
  TestCloseQuitsAndNextAcquireCreates();
  TestConcurrentAcquireCreatesOneSession();
  TestFactoryFailures();

  std::cout << "slotwatch_unit_session_registry: pass\n";
  return 0;
}
