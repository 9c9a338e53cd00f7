/**
 * @file coordinator.h
 * @brief Scan lifecycle, scanner selection and result deduplication
 *
 * The ScanCoordinator is what a UI talks to. It checks the radio and the
 * permission grants, runs one scan session at a time on the scanner for the
 * requested mode, forwards each device the first time it is seen, and
 * reports the end of every session exactly once.
 *
 * @code
 *   auto executor = std::make_shared<bluescan::SerialExecutor>();
 *   bluescan::ScanCoordinator coordinator(platform, executor, config);
 *
 *   coordinator.on_device_found([](const bluescan::DeviceRecord &d) {
 *       add_row(d.name(), d.address(), d.category());
 *   });
 *   coordinator.on_scan_complete([](const bluescan::ScanOutcome &o) {
 *       show_done(o.device_count);
 *   });
 *
 *   auto result = coordinator.start_scan(bluescan::ScanMode::LowEnergy);
 * @endcode
 */

#ifndef BLUESCAN_COORDINATOR_H
#define BLUESCAN_COORDINATOR_H

#include "config.h"
#include "device.h"
#include "error.h"
#include "executor.h"
#include "platform.h"
#include "radio.h"
#include "types.h"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace bluescan {

/**
 * @brief How a scan session ended
 */
struct ScanOutcome {
  uint64_t session_id = 0;
  ScanMode mode = ScanMode::Classic;
  CompletionReason reason = CompletionReason::Finished;

  /// Success unless reason is Failed
  Error error;

  /// Distinct devices reported during the session
  size_t device_count = 0;
};

class BLUESCAN_API ScanCoordinator {
public:
  /**
   * @param platform Radio services, adapter probe and permission source
   * @param executor Queue that scanner events are serialized on
   * @param config Timeouts and naming
   */
  ScanCoordinator(RadioPlatform platform, std::shared_ptr<Executor> executor,
                  ScanConfig config = {});

  /// Cancels a running scan without reporting it
  ~ScanCoordinator();

  // Non-copyable
  ScanCoordinator(const ScanCoordinator &) = delete;
  ScanCoordinator &operator=(const ScanCoordinator &) = delete;

  // ========================================================================
  // Commands
  // ========================================================================

  /**
   * @brief Start a scan in @p mode
   *
   * Errors:
   * - ScanInProgress: a session is Running or Cancelling
   * - RadioUnavailable / RadioDisabled: no adapter, or powered off
   * - PermissionDenied: grants missing; details lists them and the
   *   permission source has been asked for them
   * - StartFailed: the platform refused; state is back to Idle and the
   *   scanning flag never went up
   */
  Result<void> start_scan(ScanMode mode);

  /**
   * @brief Cancel the running scan of @p mode
   *
   * Completion is reported before this returns. No-op when nothing is
   * running or the running scan is of the other mode.
   */
  void cancel_scan(ScanMode mode);

  /**
   * @brief Done -> Idle
   * @return InvalidState while a session is still active
   */
  Result<void> acknowledge();

  // ========================================================================
  // Queries
  // ========================================================================

  SessionState state() const;
  bool is_scanning() const;

  /// Mode of the current or last session
  std::optional<ScanMode> active_mode() const;

  /// Devices of the current or last session, in discovery order
  std::vector<DeviceRecord> devices() const;

  /// Id of the current or last session; 0 before the first scan
  uint64_t session_id() const;

  // ========================================================================
  // Callbacks
  // ========================================================================

  /// First sighting of a device in the current session
  void on_device_found(std::function<void(const DeviceRecord &)> callback);

  /// Once per started session, after its last device
  void on_scan_complete(std::function<void(const ScanOutcome &)> callback);

  void on_scanning_changed(std::function<void(bool)> callback);

  /// Non-fatal problems: failed teardown, refused cancel
  void on_error(std::function<void(const Error &)> callback);

  /**
   * @brief Run callbacks on @p executor instead of inline
   *
   * Callbacks keep their order. Pass nullptr to go back to inline calls.
   */
  void set_callback_executor(std::shared_ptr<Executor> executor);

private:
  class Impl;
  // Shared with scanner callbacks that may still be queued on the executor
  std::shared_ptr<Impl> impl_;
};

} // namespace bluescan

#endif // BLUESCAN_COORDINATOR_H
