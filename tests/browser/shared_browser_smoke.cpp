#include "browser/shared_browser.hpp"
#include "common/assertions.hpp"
#include "core/logging/logger.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using siteaudit::browser::IBrowserEngine;
using siteaudit::browser::SharedBrowser;
using siteaudit::tests::common::AssertContains;
using siteaudit::tests::common::AssertTrue;
using siteaudit::tests::common::Fail;

namespace {

// Flags overlapping OpenPage calls; SharedBrowser must serialize them.
class CountingEngine final : public IBrowserEngine {
public:
  explicit CountingEngine(std::atomic<bool>& overlap) : overlap_(overlap) {}

  std::string Name() const override {
    return "counting";
  }

  bool OpenPage(const std::string& url, std::string& error) override {
    if (in_call_.exchange(true)) {
      overlap_ = true;
    }
    std::this_thread::yield();
    in_call_ = false;
    if (url.empty()) {
      error = "empty url";
      return false;
    }
    return true;
  }

private:
  std::atomic<bool>& overlap_;
  std::atomic<bool> in_call_{false};
};

} // namespace

int main() {
  std::ostringstream log;
  siteaudit::core::logging::Logger logger(siteaudit::core::logging::LogLevel::kInfo, log);

  std::atomic<bool> overlap{false};
  int factory_calls = 0;
  SharedBrowser browser(
      [&](std::unique_ptr<IBrowserEngine>& engine, std::string& error) {
        ++factory_calls;
        if (factory_calls == 1) {
          error = "chromium failed to launch";
          return false;
        }
        engine = std::make_unique<CountingEngine>(overlap);
        return true;
      },
      logger);

  std::string error;
  SharedBrowser::Lease lease;
  if (browser.Acquire(lease, error)) {
    Fail("first acquire should surface the factory failure");
  }
  AssertContains(error, "chromium failed to launch");
  AssertTrue(!lease.valid(), "failed acquire must not hand out a lease");
  AssertContains(log.str(), "browser engine creation failed");

  error.clear();
  if (!browser.Acquire(lease, error)) {
    Fail("second acquire should retry creation: " + error);
  }
  AssertTrue(lease.valid(), "lease should be held");
  AssertContains(log.str(), "browser engine started");

  if (browser.Shutdown()) {
    Fail("shutdown must be refused while a lease is outstanding");
  }

  // Concurrent audits share the engine; creation happens only once.
  std::vector<std::thread> workers;
  std::atomic<int> opened{0};
  for (int i = 0; i < 4; ++i) {
    workers.emplace_back([&browser, &opened] {
      SharedBrowser::Lease worker_lease;
      std::string worker_error;
      if (!browser.Acquire(worker_lease, worker_error)) {
        return;
      }
      for (int page = 0; page < 25; ++page) {
        if (worker_lease.OpenPage("https://shop.example.com/" + std::to_string(page),
                                  worker_error)) {
          ++opened;
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  AssertTrue(opened == 100, "every worker page open should succeed");
  AssertTrue(!overlap, "engine calls must be serialized");

  const SharedBrowser::Snapshot snapshot = browser.DebugSnapshot();
  AssertTrue(snapshot.created, "engine should be running");
  AssertTrue(snapshot.create_calls == 1U, "engine should be created exactly once");
  AssertTrue(snapshot.active_leases == 1U, "only the main lease should remain");
  AssertTrue(snapshot.pages_opened == 100U, "page counter should match");
  AssertTrue(factory_calls == 2, "factory retried exactly once");

  SharedBrowser::Lease moved = std::move(lease);
  AssertTrue(!lease.valid() && moved.valid(), "lease ownership should move");
  if (moved.OpenPage("", error)) {
    Fail("engine errors should propagate through the lease");
  }
  AssertContains(error, "empty url");

  moved.Release();
  moved.Release();
  AssertTrue(browser.DebugSnapshot().active_leases == 0U, "release should be idempotent");

  SharedBrowser::Lease stale;
  if (stale.OpenPage("https://shop.example.com/", error)) {
    Fail("unheld lease must not open pages");
  }
  AssertContains(error, "browser lease is not held");

  if (!browser.Shutdown()) {
    Fail("shutdown should succeed once leases are released");
  }
  AssertTrue(!browser.DebugSnapshot().created, "engine should be destroyed");
  AssertContains(log.str(), "browser engine stopped");

  std::cout << "shared_browser_smoke: ok\n";
  return 0;
}
