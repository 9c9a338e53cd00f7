/**
 * @file session.cpp
 * @brief Scan session state machine
 */

#include "bluescan/session.h"

namespace bluescan {

// Idle and Done are terminal for a session object; a new scan gets a new
// session.
const std::map<SessionState, std::set<SessionState>>
    ScanSession::valid_transitions_ = {
        // Running -> Cancelling, Done, Idle (start refused)
        {SessionState::Running,
         {SessionState::Cancelling, SessionState::Done, SessionState::Idle}},

        // Cancelling -> Done
        {SessionState::Cancelling, {SessionState::Done}},

        {SessionState::Done, {}},
        {SessionState::Idle, {}}};

ScanSession::ScanSession(uint64_t id, ScanMode mode)
    : id_(id), mode_(mode), state_(SessionState::Running) {}

bool ScanSession::is_active() const {
  SessionState s = state_.load();
  return s == SessionState::Running || s == SessionState::Cancelling;
}

bool ScanSession::is_valid_transition(SessionState from, SessionState to) {
  auto it = valid_transitions_.find(from);
  if (it == valid_transitions_.end()) {
    return false;
  }
  return it->second.count(to) > 0;
}

bool ScanSession::transition(SessionState from, SessionState to) {
  if (!is_valid_transition(from, to)) {
    return false;
  }
  return state_.compare_exchange_strong(from, to);
}

bool ScanSession::begin_cancel() {
  return transition(SessionState::Running, SessionState::Cancelling);
}

bool ScanSession::try_finish() {
  if (transition(SessionState::Running, SessionState::Done)) {
    return true;
  }
  return transition(SessionState::Cancelling, SessionState::Done);
}

bool ScanSession::abort_start() {
  return transition(SessionState::Running, SessionState::Idle);
}

bool ScanSession::mark_seen(const std::string &address) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.load() != SessionState::Running) {
    return false;
  }
  return seen_addresses_.insert(address).second;
}

bool ScanSession::has_seen(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return seen_addresses_.count(address) > 0;
}

size_t ScanSession::seen_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return seen_addresses_.size();
}

void ScanSession::attach_subscription(SubscriptionHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscription_ = handle;
}

std::optional<SubscriptionHandle> ScanSession::release_subscription() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<SubscriptionHandle> handle = subscription_;
  subscription_.reset();
  return handle;
}

bool ScanSession::has_subscription() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscription_.has_value();
}

} // namespace bluescan
