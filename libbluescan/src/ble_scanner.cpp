/**
 * @file ble_scanner.cpp
 * @brief Advertisement-based discovery with a timeout
 */

#include "scanner_pimpl.h"
#include <utility>

namespace bluescan {

LowEnergyScanner::LowEnergyScanner(
    std::shared_ptr<LowEnergyRadioService> service,
    std::shared_ptr<Executor> executor, Milliseconds timeout,
    std::string unknown_name)
    : Scanner(std::move(executor)), service_(std::move(service)),
      timeout_(timeout), unknown_name_(std::move(unknown_name)) {}

Result<void> LowEnergyScanner::start(std::shared_ptr<ScanSession> session,
                                     FoundCallback on_found,
                                     DoneCallback on_done) {
  BLUESCAN_REQUIRE(session, ErrorCode::InvalidArgument, "No session");
  BLUESCAN_REQUIRE(session->mode() == ScanMode::LowEnergy,
                   ErrorCode::InvalidArgument,
                   "Session is not a low-energy scan");
  BLUESCAN_REQUIRE(!is_running(), ErrorCode::ScanInProgress,
                   "Low-energy scan already running");

  auto service = service_;
  auto scan = make_active(session, std::move(on_found), std::move(on_done),
                          [service](SubscriptionHandle handle) {
                            return service->stop_scan(handle);
                          });

  std::weak_ptr<ActiveScan> weak = scan;
  std::string unknown_name = unknown_name_;
  auto handle = service_->start_scan(
      [weak, unknown_name](const LowEnergyScanResult &result) {
        auto active = weak.lock();
        if (!active || !result.device) {
          return;
        }
        auto record = DeviceRecord::from_raw(*result.device, unknown_name);
        if (record.address().empty()) {
          return;
        }
        active->deliver(std::move(record));
      },
      [weak](const Error &error) {
        if (auto active = weak.lock()) {
          active->post_finalize(CompletionReason::Failed,
                                Error(ErrorCode::ScanFailed,
                                      "Low-energy scan failed",
                                      error.to_string()));
        }
      });
  if (handle.is_error()) {
    return Error(ErrorCode::StartFailed, "Could not start low-energy scan",
                 handle.error().to_string());
  }
  session->attach_subscription(handle.value());
  set_current(scan);

  // Runs behind any results already queued when it falls due
  scan->timer = executor_->post_delayed(timeout_, [scan]() {
    scan->timer = 0;
    scan->finalize(CompletionReason::TimedOut, Error::ok());
  });

  return Result<void>::ok();
}

void LowEnergyScanner::cancel() {
  auto scan = current();
  if (!scan || !scan->session->begin_cancel()) {
    return;
  }
  scan->finalize(CompletionReason::Cancelled, Error::ok());
}

} // namespace bluescan
