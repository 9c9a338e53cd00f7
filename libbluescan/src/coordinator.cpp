/**
 * @file coordinator.cpp
 * @brief ScanCoordinator implementation
 */

#include "bluescan/coordinator.h"
#include "bluescan/permission.h"
#include "bluescan/scanner.h"
#include "bluescan/session.h"
#include <mutex>
#include <utility>

namespace bluescan {

// ============================================================================
// ScanCoordinator::Impl
// ============================================================================

class ScanCoordinator::Impl : public std::enable_shared_from_this<Impl> {
public:
  RadioPlatform platform;
  std::shared_ptr<Executor> executor;
  ScanConfig config;

  std::unique_ptr<ClassicScanner> classic;
  std::unique_ptr<LowEnergyScanner> low_energy;

  // Guards the fields below
  mutable std::mutex mutex;

  std::shared_ptr<ScanSession> session;
  std::vector<DeviceRecord> devices;
  bool scanning = false;
  uint64_t next_session_id = 1;
  uint64_t last_session_id = 0;
  std::optional<ScanMode> last_mode;

  std::function<void(const DeviceRecord &)> device_found_cb;
  std::function<void(const ScanOutcome &)> scan_complete_cb;
  std::function<void(bool)> scanning_changed_cb;
  std::function<void(const Error &)> error_cb;
  std::shared_ptr<Executor> callback_executor;

  // Held while deciding on and dispatching a callback, so callbacks leave
  // in the order their events were decided. Recursive because an inline
  // callback may call back into cancel_scan().
  std::recursive_mutex delivery_mutex;

  Scanner *scanner_for(ScanMode mode) {
    if (mode == ScanMode::LowEnergy) {
      return low_energy.get();
    }
    return classic.get();
  }

  /// Run inline or on the callback executor. Call under delivery_mutex.
  void dispatch(Task task) {
    std::shared_ptr<Executor> target;
    {
      std::lock_guard<std::mutex> lock(mutex);
      target = callback_executor;
    }
    if (target) {
      target->post(std::move(task));
    } else {
      task();
    }
  }

  void handle_found(const std::shared_ptr<ScanSession> &from,
                    const DeviceRecord &record) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex);

    std::function<void(const DeviceRecord &)> cb;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (from != session) {
        return;
      }
      // First write wins: later sightings of an address are dropped
      if (!from->mark_seen(record.address())) {
        return;
      }
      devices.push_back(record);
      cb = device_found_cb;
    }

    if (cb) {
      dispatch([cb, record]() { cb(record); });
    }
  }

  void handle_done(const std::shared_ptr<ScanSession> &from,
                   CompletionReason reason, const Error &error) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex);

    ScanOutcome outcome;
    outcome.session_id = from->id();
    outcome.mode = from->mode();
    outcome.reason = reason;
    outcome.error = error;
    outcome.device_count = from->seen_count();

    bool lowered = false;
    std::function<void(bool)> scanning_cb;
    std::function<void(const ScanOutcome &)> complete_cb;
    {
      std::lock_guard<std::mutex> lock(mutex);
      // A newer session may already own the flag
      if (from == session && scanning) {
        scanning = false;
        lowered = true;
      }
      scanning_cb = scanning_changed_cb;
      complete_cb = scan_complete_cb;
    }

    if (lowered && scanning_cb) {
      dispatch([scanning_cb]() { scanning_cb(false); });
    }
    if (complete_cb) {
      dispatch([complete_cb, outcome]() { complete_cb(outcome); });
    }
  }

  void handle_diagnostic(const Error &error) {
    std::lock_guard<std::recursive_mutex> delivery(delivery_mutex);

    std::function<void(const Error &)> cb;
    {
      std::lock_guard<std::mutex> lock(mutex);
      cb = error_cb;
    }
    if (cb) {
      dispatch([cb, error]() { cb(error); });
    }
  }

  Result<void> check_radio() const {
    if (!platform.adapter->is_present()) {
      return Error(ErrorCode::RadioUnavailable, "No radio adapter present");
    }
    if (!platform.adapter->is_enabled()) {
      return Error(ErrorCode::RadioDisabled, "Radio adapter is powered off");
    }
    return Result<void>::ok();
  }

  Result<void> check_permissions() {
    auto &source = platform.permissions;
    CapabilitySet missing = PermissionGate::missing_capabilities(
        source->platform_version(), source->granted_capabilities());
    if (missing.empty()) {
      return Result<void>::ok();
    }

    // The user starts again once the request settles
    source->request_capabilities(missing, []() {});
    return Error(ErrorCode::PermissionDenied,
                 "Missing permissions for scanning",
                 capabilities_to_string(missing));
  }
};

// ============================================================================
// ScanCoordinator
// ============================================================================

ScanCoordinator::ScanCoordinator(RadioPlatform platform,
                                 std::shared_ptr<Executor> executor,
                                 ScanConfig config)
    : impl_(std::make_shared<Impl>()) {
  impl_->platform = std::move(platform);
  impl_->executor = std::move(executor);
  impl_->config = std::move(config);

  if (impl_->platform.is_complete() && impl_->executor) {
    impl_->classic = std::make_unique<ClassicScanner>(
        impl_->platform.classic, impl_->platform.permissions, impl_->executor,
        impl_->config.unknown_device_name);
    impl_->low_energy = std::make_unique<LowEnergyScanner>(
        impl_->platform.low_energy, impl_->executor,
        impl_->config.low_energy_timeout, impl_->config.unknown_device_name);

    std::weak_ptr<Impl> weak = impl_;
    auto diagnostic = [weak](const Error &error) {
      if (auto impl = weak.lock()) {
        impl->handle_diagnostic(error);
      }
    };
    impl_->classic->on_diagnostic(diagnostic);
    impl_->low_energy->on_diagnostic(diagnostic);
  }
}

ScanCoordinator::~ScanCoordinator() {
  std::shared_ptr<ScanSession> session;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->device_found_cb = nullptr;
    impl_->scan_complete_cb = nullptr;
    impl_->scanning_changed_cb = nullptr;
    impl_->error_cb = nullptr;
    session = impl_->session;
  }

  // Release the platform registration of a scan still running
  if (session && session->is_active()) {
    if (Scanner *scanner = impl_->scanner_for(session->mode())) {
      scanner->cancel();
    }
  }
}

Result<void> ScanCoordinator::start_scan(ScanMode mode) {
  std::lock_guard<std::recursive_mutex> delivery(impl_->delivery_mutex);

  std::shared_ptr<ScanSession> session;
  std::function<void(bool)> scanning_cb;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    BLUESCAN_REQUIRE(impl_->classic && impl_->low_energy,
                     ErrorCode::NotInitialized,
                     "Radio platform is incomplete");

    if (impl_->session && impl_->session->is_active()) {
      return Error(ErrorCode::ScanInProgress, "A scan is already running",
                   scan_mode_name(impl_->session->mode()));
    }

    BLUESCAN_TRY(impl_->check_radio());
    BLUESCAN_TRY(impl_->check_permissions());

    session = std::make_shared<ScanSession>(impl_->next_session_id, mode);
    impl_->session = session;
    impl_->devices.clear();
  }

  std::weak_ptr<Impl> weak = impl_;
  auto on_found = [weak, session](const DeviceRecord &record) {
    if (auto impl = weak.lock()) {
      impl->handle_found(session, record);
    }
  };
  auto on_done = [weak, session](CompletionReason reason, const Error &error) {
    if (auto impl = weak.lock()) {
      impl->handle_done(session, reason, error);
    }
  };

  auto started = impl_->scanner_for(mode)->start(session, on_found, on_done);
  if (started.is_error()) {
    session->abort_start();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->session.reset();
    impl_->devices.clear();
    return started.error();
  }

  // Found events are still queued behind delivery_mutex, so the flag is
  // raised before any of them is delivered
  bool raised = false;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    ++impl_->next_session_id;
    impl_->last_session_id = session->id();
    impl_->last_mode = mode;
    if (impl_->session == session && session->is_active()) {
      impl_->scanning = true;
      raised = true;
    }
    scanning_cb = impl_->scanning_changed_cb;
  }

  if (raised && scanning_cb) {
    impl_->dispatch([scanning_cb]() { scanning_cb(true); });
  }

  return Result<void>::ok();
}

void ScanCoordinator::cancel_scan(ScanMode mode) {
  Scanner *scanner = nullptr;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->session ||
        impl_->session->state() != SessionState::Running ||
        impl_->session->mode() != mode) {
      return;
    }
    scanner = impl_->scanner_for(mode);
  }

  scanner->cancel();
}

Result<void> ScanCoordinator::acknowledge() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!impl_->session) {
    return Result<void>::ok();
  }
  BLUESCAN_REQUIRE(impl_->session->state() == SessionState::Done,
                   ErrorCode::InvalidState, "Scan is still running");

  impl_->session.reset();
  return Result<void>::ok();
}

// ============================================================================
// Queries
// ============================================================================

SessionState ScanCoordinator::state() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->session ? impl_->session->state() : SessionState::Idle;
}

bool ScanCoordinator::is_scanning() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->scanning;
}

std::optional<ScanMode> ScanCoordinator::active_mode() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->last_mode;
}

std::vector<DeviceRecord> ScanCoordinator::devices() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->devices;
}

uint64_t ScanCoordinator::session_id() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->last_session_id;
}

// ============================================================================
// Callbacks
// ============================================================================

void ScanCoordinator::on_device_found(
    std::function<void(const DeviceRecord &)> callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->device_found_cb = std::move(callback);
}

void ScanCoordinator::on_scan_complete(
    std::function<void(const ScanOutcome &)> callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->scan_complete_cb = std::move(callback);
}

void ScanCoordinator::on_scanning_changed(std::function<void(bool)> callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->scanning_changed_cb = std::move(callback);
}

void ScanCoordinator::on_error(std::function<void(const Error &)> callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->error_cb = std::move(callback);
}

void ScanCoordinator::set_callback_executor(
    std::shared_ptr<Executor> executor) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->callback_executor = std::move(executor);
}

} // namespace bluescan
