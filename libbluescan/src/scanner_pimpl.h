/**
 * @file scanner_pimpl.h
 * @brief Per-pass state shared between a scanner and its queued tasks
 */

#ifndef BLUESCAN_SCANNER_PIMPL_H
#define BLUESCAN_SCANNER_PIMPL_H

#include "bluescan/scanner.h"
#include <atomic>

namespace bluescan {

/**
 * One discovery pass. Platform handlers hold it weakly; tasks queued on the
 * executor hold it strongly so a pass can always finish.
 */
struct Scanner::ActiveScan : public std::enable_shared_from_this<ActiveScan> {
  std::shared_ptr<ScanSession> session;
  std::shared_ptr<Executor> executor;
  FoundCallback found_cb;
  DoneCallback done_cb;
  DiagnosticCallback diagnostic_cb;

  // Unsubscribe (classic) or stop the platform scan (low energy)
  std::function<Result<void>(SubscriptionHandle)> release;

  std::atomic<TimerId> timer{0};

  /// Queue a found event; dropped if the session stopped meanwhile
  void deliver(DeviceRecord record);

  /// Queue finalize() behind everything already posted
  void post_finalize(CompletionReason reason, Error error);

  /**
   * Tear down the pass and report completion. Only the caller that wins
   * ScanSession::try_finish() does anything.
   */
  void finalize(CompletionReason reason, const Error &error);

  void report(const Error &error) const;
};

} // namespace bluescan

#endif // BLUESCAN_SCANNER_PIMPL_H
