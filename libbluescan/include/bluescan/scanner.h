/**
 * @file scanner.h
 * @brief Classic and low-energy discovery drivers
 *
 * A scanner runs one discovery pass at a time against a platform radio
 * service. It normalizes every platform result into a DeviceRecord and
 * reports it through the found callback, then reports the end of the pass
 * exactly once through the done callback.
 *
 * Found and natural/timeout completion callbacks run on the scanner's
 * Executor. cancel() completes the session synchronously on the calling
 * thread.
 */

#ifndef BLUESCAN_SCANNER_H
#define BLUESCAN_SCANNER_H

#include "device.h"
#include "error.h"
#include "executor.h"
#include "permission.h"
#include "radio.h"
#include "session.h"
#include "types.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace bluescan {

// ============================================================================
// Scanner Interface
// ============================================================================

using FoundCallback = std::function<void(const DeviceRecord &)>;

/// Error is success unless reason is CompletionReason::Failed
using DoneCallback = std::function<void(CompletionReason, const Error &)>;

/// Non-fatal problems (failed teardown, refused cancel)
using DiagnosticCallback = std::function<void(const Error &)>;

/**
 * @brief Common interface of the two discovery drivers
 */
class BLUESCAN_API Scanner {
public:
  virtual ~Scanner();

  // Non-copyable
  Scanner(const Scanner &) = delete;
  Scanner &operator=(const Scanner &) = delete;

  /// The mode this scanner implements
  virtual ScanMode mode() const = 0;

  /**
   * @brief Begin one discovery pass for @p session
   * @param session Running session of this scanner's mode
   * @param on_found Called for each normalized result
   * @param on_done Called once when the pass ends, however it ends
   * @return Error if nothing was started; on_done will not be called then
   */
  virtual Result<void> start(std::shared_ptr<ScanSession> session,
                             FoundCallback on_found, DoneCallback on_done) = 0;

  /**
   * @brief Stop the running pass now
   *
   * Drives the session to Done and calls on_done before returning. No-op
   * if nothing is running.
   */
  virtual void cancel() = 0;

  /// True while the current session is Running or Cancelling
  bool is_running() const;

  /// Register the handler for non-fatal problems
  void on_diagnostic(DiagnosticCallback callback);

  struct ActiveScan;

protected:
  explicit Scanner(std::shared_ptr<Executor> executor);

  std::shared_ptr<ActiveScan> current() const;
  void set_current(std::shared_ptr<ActiveScan> scan);

  std::shared_ptr<ActiveScan>
  make_active(std::shared_ptr<ScanSession> session, FoundCallback on_found,
              DoneCallback on_done,
              std::function<Result<void>(SubscriptionHandle)> release);

  void report(const Error &error) const;

  std::shared_ptr<Executor> executor_;

private:
  mutable std::mutex mutex_;
  std::shared_ptr<ActiveScan> current_;
  DiagnosticCallback diagnostic_cb_;
};

// ============================================================================
// Classic Scanner
// ============================================================================

/**
 * @brief Inquiry-based discovery through event subscription
 *
 * @code
 *   ClassicScanner scanner(classic_service, permissions, executor);
 *   auto session = std::make_shared<ScanSession>(1, ScanMode::Classic);
 *   scanner.start(session,
 *                 [](const DeviceRecord &d) { show(d); },
 *                 [](CompletionReason, const Error &) { done(); });
 * @endcode
 */
class BLUESCAN_API ClassicScanner : public Scanner {
public:
  ClassicScanner(std::shared_ptr<ClassicRadioService> service,
                 std::shared_ptr<PermissionSource> permissions,
                 std::shared_ptr<Executor> executor,
                 std::string unknown_name = DeviceRecord::UNKNOWN_NAME);

  ScanMode mode() const override { return ScanMode::Classic; }

  /**
   * @brief Subscribe to inquiry events and begin an inquiry
   *
   * Fails with PermissionDenied when the platform ties inquiry to location
   * and no location grant is held, and with StartFailed when the platform
   * refuses the subscription or the inquiry. In both cases nothing stays
   * subscribed.
   */
  Result<void> start(std::shared_ptr<ScanSession> session,
                     FoundCallback on_found, DoneCallback on_done) override;

  /**
   * @brief Cancel the inquiry and finalize without waiting for the
   *        platform's finished event, which may never come
   */
  void cancel() override;

private:
  std::shared_ptr<ClassicRadioService> service_;
  std::shared_ptr<PermissionSource> permissions_;
  std::string unknown_name_;
};

// ============================================================================
// Low Energy Scanner
// ============================================================================

/// How long a low-energy scan runs before it stops itself
constexpr Milliseconds DEFAULT_LOW_ENERGY_TIMEOUT{12000};

/**
 * @brief Advertisement-based discovery with a hard timeout
 */
class BLUESCAN_API LowEnergyScanner : public Scanner {
public:
  LowEnergyScanner(std::shared_ptr<LowEnergyRadioService> service,
                   std::shared_ptr<Executor> executor,
                   Milliseconds timeout = DEFAULT_LOW_ENERGY_TIMEOUT,
                   std::string unknown_name = DeviceRecord::UNKNOWN_NAME);

  ScanMode mode() const override { return ScanMode::LowEnergy; }

  /**
   * @brief Start the platform scan and arm the timeout
   *
   * The platform never ends a low-energy scan by itself: the pass ends on
   * timeout, cancel(), or a platform failure.
   */
  Result<void> start(std::shared_ptr<ScanSession> session,
                     FoundCallback on_found, DoneCallback on_done) override;

  void cancel() override;

  Milliseconds timeout() const { return timeout_; }

private:
  std::shared_ptr<LowEnergyRadioService> service_;
  Milliseconds timeout_;
  std::string unknown_name_;
};

} // namespace bluescan

#endif // BLUESCAN_SCANNER_H
