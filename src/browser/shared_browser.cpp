#include "browser/shared_browser.hpp"

#include "core/logging/logger.hpp"

#include <utility>

namespace siteaudit::browser {

SharedBrowser::Lease::~Lease() {
  Release();
}

SharedBrowser::Lease::Lease(Lease&& other) noexcept {
  owner_ = std::exchange(other.owner_, nullptr);
}

SharedBrowser::Lease& SharedBrowser::Lease::operator=(Lease&& other) noexcept {
  if (this == &other) {
    return *this;
  }

  Release();
  owner_ = std::exchange(other.owner_, nullptr);
  return *this;
}

bool SharedBrowser::Lease::OpenPage(const std::string& url, std::string& error) {
  if (owner_ == nullptr) {
    error = "browser lease is not held";
    return false;
  }
  std::lock_guard<std::mutex> lock(owner_->mu_);
  return owner_->OpenPageLocked(url, error);
}

void SharedBrowser::Lease::Release() {
  if (owner_ == nullptr) {
    return;
  }
  std::exchange(owner_, nullptr)->ReleaseOne();
}

SharedBrowser::SharedBrowser(EngineFactory factory, core::logging::Logger& logger)
    : factory_(std::move(factory)), logger_(logger) {}

SharedBrowser::~SharedBrowser() {
  std::lock_guard<std::mutex> lock(mu_);
  engine_.reset();
}

bool SharedBrowser::Acquire(Lease& lease, std::string& error) {
  lease.Release();

  std::lock_guard<std::mutex> lock(mu_);
  ++acquire_calls_;
  if (engine_ == nullptr) {
    if (!factory_) {
      error = "no browser engine factory configured";
      return false;
    }
    std::unique_ptr<IBrowserEngine> created;
    if (!factory_(created, error) || created == nullptr) {
      if (error.empty()) {
        error = "browser engine factory returned no engine";
      }
      logger_.Error("browser engine creation failed", {{"error", error}});
      return false;
    }
    engine_ = std::move(created);
    ++create_calls_;
    logger_.Info("browser engine started", {{"engine", engine_->Name()}});
  }

  ++active_leases_;
  lease.owner_ = this;
  return true;
}

bool SharedBrowser::Shutdown() {
  std::lock_guard<std::mutex> lock(mu_);
  if (active_leases_ > 0U) {
    return false;
  }
  if (engine_ != nullptr) {
    logger_.Info("browser engine stopped", {{"engine", engine_->Name()}});
    engine_.reset();
  }
  return true;
}

SharedBrowser::Snapshot SharedBrowser::DebugSnapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return Snapshot{
      .created = engine_ != nullptr,
      .active_leases = active_leases_,
      .create_calls = create_calls_,
      .acquire_calls = acquire_calls_,
      .pages_opened = pages_opened_,
  };
}

void SharedBrowser::ReleaseOne() {
  std::lock_guard<std::mutex> lock(mu_);
  if (active_leases_ > 0U) {
    --active_leases_;
  }
}

bool SharedBrowser::OpenPageLocked(const std::string& url, std::string& error) {
  if (engine_ == nullptr) {
    error = "browser engine is not running";
    return false;
  }
  if (!engine_->OpenPage(url, error)) {
    return false;
  }
  ++pages_opened_;
  return true;
}

} // namespace siteaudit::browser
