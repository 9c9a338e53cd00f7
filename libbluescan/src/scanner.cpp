/**
 * @file scanner.cpp
 * @brief Shared scanner plumbing
 */

#include "scanner_pimpl.h"
#include <utility>

namespace bluescan {

// ============================================================================
// ActiveScan
// ============================================================================

void Scanner::ActiveScan::deliver(DeviceRecord record) {
  auto self = shared_from_this();
  executor->post([self, record = std::move(record)]() {
    if (self->session->state() != SessionState::Running) {
      return;
    }
    if (self->found_cb) {
      self->found_cb(record);
    }
  });
}

void Scanner::ActiveScan::post_finalize(CompletionReason reason, Error error) {
  auto self = shared_from_this();
  executor->post([self, reason, error = std::move(error)]() {
    self->finalize(reason, error);
  });
}

void Scanner::ActiveScan::finalize(CompletionReason reason,
                                   const Error &error) {
  if (!session->try_finish()) {
    return;
  }

  TimerId pending_timer = timer.exchange(0);
  if (pending_timer != 0) {
    executor->cancel(pending_timer);
  }

  auto handle = session->release_subscription();
  if (handle && release) {
    auto result = release(*handle);
    if (result.is_error()) {
      report(Error(ErrorCode::TeardownError,
                   "Failed to release platform registration",
                   result.error().to_string()));
    }
  }

  if (done_cb) {
    done_cb(reason, error);
  }
}

void Scanner::ActiveScan::report(const Error &error) const {
  if (diagnostic_cb) {
    diagnostic_cb(error);
  }
}

// ============================================================================
// Scanner
// ============================================================================

Scanner::Scanner(std::shared_ptr<Executor> executor)
    : executor_(std::move(executor)) {}

Scanner::~Scanner() = default;

bool Scanner::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_ && current_->session->is_active();
}

void Scanner::on_diagnostic(DiagnosticCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  diagnostic_cb_ = std::move(callback);
}

std::shared_ptr<Scanner::ActiveScan> Scanner::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void Scanner::set_current(std::shared_ptr<ActiveScan> scan) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = std::move(scan);
}

std::shared_ptr<Scanner::ActiveScan> Scanner::make_active(
    std::shared_ptr<ScanSession> session, FoundCallback on_found,
    DoneCallback on_done,
    std::function<Result<void>(SubscriptionHandle)> release) {
  auto scan = std::make_shared<ActiveScan>();
  scan->session = std::move(session);
  scan->executor = executor_;
  scan->found_cb = std::move(on_found);
  scan->done_cb = std::move(on_done);
  scan->release = std::move(release);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    scan->diagnostic_cb = diagnostic_cb_;
  }
  return scan;
}

void Scanner::report(const Error &error) const {
  DiagnosticCallback cb;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cb = diagnostic_cb_;
  }
  if (cb) {
    cb(error);
  }
}

} // namespace bluescan
