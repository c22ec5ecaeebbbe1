#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace siteaudit::core::logging {
class Logger;
}

namespace siteaudit::browser {

// Process-level browser engine (one headless browser shared by all audits).
// Implementations need not be thread-safe; SharedBrowser serializes calls.
class IBrowserEngine {
public:
  virtual ~IBrowserEngine() = default;
  virtual std::string Name() const = 0;
  virtual bool OpenPage(const std::string& url, std::string& error) = 0;
};

using EngineFactory =
    std::function<bool(std::unique_ptr<IBrowserEngine>& engine, std::string& error)>;

// Lazily created, reference-counted browser instance.
//
// - the engine is built by `factory` on first Acquire and reused afterwards
// - every user holds a Lease; the engine cannot be shut down while leases
//   are outstanding
// - engine calls made through leases are serialized on one mutex
class SharedBrowser {
public:
  SharedBrowser(EngineFactory factory, core::logging::Logger& logger);
  ~SharedBrowser();

  SharedBrowser(const SharedBrowser&) = delete;
  SharedBrowser& operator=(const SharedBrowser&) = delete;

  class Lease {
  public:
    Lease() = default;
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    bool valid() const {
      return owner_ != nullptr;
    }

    bool OpenPage(const std::string& url, std::string& error);

    // Returns the lease early. Safe to call repeatedly.
    void Release();

  private:
    friend class SharedBrowser;

    SharedBrowser* owner_ = nullptr;
  };

  // Contract:
  // - true: `lease` holds the shared engine (created now if needed).
  // - false: engine creation failed; `error` explains and the next Acquire
  //   retries creation.
  bool Acquire(Lease& lease, std::string& error);

  // Destroys the engine when no lease is outstanding. Returns false (and
  // leaves the engine running) otherwise.
  bool Shutdown();

  struct Snapshot {
    bool created = false;
    std::uint32_t active_leases = 0;
    std::uint64_t create_calls = 0;
    std::uint64_t acquire_calls = 0;
    std::uint64_t pages_opened = 0;
  };

  Snapshot DebugSnapshot() const;

private:
  void ReleaseOne();
  bool OpenPageLocked(const std::string& url, std::string& error);

  EngineFactory factory_;
  core::logging::Logger& logger_;

  mutable std::mutex mu_;
  std::unique_ptr<IBrowserEngine> engine_;
  std::uint32_t active_leases_ = 0;
  std::uint64_t create_calls_ = 0;
  std::uint64_t acquire_calls_ = 0;
  std::uint64_t pages_opened_ = 0;
};

} // namespace siteaudit::browser
