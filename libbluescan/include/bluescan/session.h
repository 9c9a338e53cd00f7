/**
 * @file session.h
 * @brief One bounded start-to-finish discovery attempt
 *
 * A ScanSession owns the state of a single scan: its mode, its lifecycle
 * state, the set of addresses already reported, and the platform
 * subscription handle. The subscription is released exactly once, by
 * whichever path (natural finish, timeout, cancel, failure) wins the
 * transition to Done.
 *
 * State machine:
 * @code
 *   Running ---------------------------> Done
 *      |                                  ^
 *      +--> Cancelling -------------------+
 *      |
 *      +--> Idle   (start failed, session discarded)
 * @endcode
 */

#ifndef BLUESCAN_SESSION_H
#define BLUESCAN_SESSION_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>

namespace bluescan {

class BLUESCAN_API ScanSession {
public:
  /// New sessions start Running
  ScanSession(uint64_t id, ScanMode mode);

  // Non-copyable
  ScanSession(const ScanSession &) = delete;
  ScanSession &operator=(const ScanSession &) = delete;

  uint64_t id() const { return id_; }
  ScanMode mode() const { return mode_; }
  SessionState state() const { return state_.load(); }

  /// Running or Cancelling
  bool is_active() const;

  // ========================================================================
  // Transitions
  // ========================================================================

  /**
   * @brief Running -> Cancelling
   * @return false if the session was not running
   */
  bool begin_cancel();

  /**
   * @brief Running|Cancelling -> Done
   *
   * Atomic check-and-set. Exactly one caller per session gets true; that
   * caller owns the teardown and the completion callback.
   */
  bool try_finish();

  /**
   * @brief Running -> Idle, for a start the platform refused
   * @return false if the session was not running
   */
  bool abort_start();

  /// Check a transition against the table without performing it
  static bool is_valid_transition(SessionState from, SessionState to);

  // ========================================================================
  // Deduplication
  // ========================================================================

  /**
   * @brief Record an address as seen
   * @return true the first time an address is seen while Running;
   *         false for repeats and for any address once the session stopped
   */
  bool mark_seen(const std::string &address);

  bool has_seen(const std::string &address) const;
  size_t seen_count() const;

  // ========================================================================
  // Subscription
  // ========================================================================

  /// Store the platform handle for this session's registration or scan
  void attach_subscription(SubscriptionHandle handle);

  /**
   * @brief Take the handle out of the session
   * @return The handle the first time; nullopt afterwards
   */
  std::optional<SubscriptionHandle> release_subscription();

  bool has_subscription() const;

private:
  bool transition(SessionState from, SessionState to);

  const uint64_t id_;
  const ScanMode mode_;
  std::atomic<SessionState> state_;

  mutable std::mutex mutex_;
  std::unordered_set<std::string> seen_addresses_;
  std::optional<SubscriptionHandle> subscription_;

  static const std::map<SessionState, std::set<SessionState>>
      valid_transitions_;
};

} // namespace bluescan

#endif // BLUESCAN_SESSION_H
