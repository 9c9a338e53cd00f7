/**
 * @file classic_scanner.cpp
 * @brief Inquiry-based discovery
 */

#include "scanner_pimpl.h"
#include <utility>

namespace bluescan {

namespace {

void handle_classic_event(Scanner::ActiveScan &scan, const ClassicEvent &event,
                          const std::string &unknown_name) {
  switch (event.kind) {
  case ClassicEventKind::DiscoveryStarted:
    break;

  case ClassicEventKind::DeviceFound:
    // Events without a usable device handle carry nothing to report
    if (!event.device) {
      return;
    }
    {
      auto record = DeviceRecord::from_raw(*event.device, unknown_name);
      if (record.address().empty()) {
        return;
      }
      scan.deliver(std::move(record));
    }
    break;

  case ClassicEventKind::DiscoveryFinished:
    if (event.error && event.error->is_error()) {
      scan.post_finalize(CompletionReason::Failed,
                         Error(ErrorCode::ScanFailed, "Inquiry failed",
                               event.error->to_string()));
    } else {
      scan.post_finalize(CompletionReason::Finished, Error::ok());
    }
    break;
  }
}

} // namespace

ClassicScanner::ClassicScanner(std::shared_ptr<ClassicRadioService> service,
                               std::shared_ptr<PermissionSource> permissions,
                               std::shared_ptr<Executor> executor,
                               std::string unknown_name)
    : Scanner(std::move(executor)), service_(std::move(service)),
      permissions_(std::move(permissions)),
      unknown_name_(std::move(unknown_name)) {}

Result<void> ClassicScanner::start(std::shared_ptr<ScanSession> session,
                                   FoundCallback on_found,
                                   DoneCallback on_done) {
  BLUESCAN_REQUIRE(session, ErrorCode::InvalidArgument, "No session");
  BLUESCAN_REQUIRE(session->mode() == ScanMode::Classic,
                   ErrorCode::InvalidArgument, "Session is not a classic scan");
  BLUESCAN_REQUIRE(!is_running(), ErrorCode::ScanInProgress,
                   "Inquiry already running");

  // Older platforms report no inquiry results without a location grant
  if (PermissionGate::requires_location(permissions_->platform_version()) &&
      !PermissionGate::has_location_capability(
          permissions_->granted_capabilities())) {
    return Error(ErrorCode::PermissionDenied,
                 "Location permission is required for inquiry",
                 capability_name(Capability::CoarseLocation));
  }

  auto service = service_;
  auto scan = make_active(session, std::move(on_found), std::move(on_done),
                          [service](SubscriptionHandle handle) {
                            return service->unsubscribe(handle);
                          });

  std::weak_ptr<ActiveScan> weak = scan;
  std::string unknown_name = unknown_name_;
  auto subscription = service_->subscribe(
      {ClassicEventKind::DiscoveryStarted, ClassicEventKind::DeviceFound,
       ClassicEventKind::DiscoveryFinished},
      [weak, unknown_name](const ClassicEvent &event) {
        if (auto active = weak.lock()) {
          handle_classic_event(*active, event, unknown_name);
        }
      });
  if (subscription.is_error()) {
    return Error(ErrorCode::StartFailed,
                 "Could not subscribe to inquiry events",
                 subscription.error().to_string());
  }
  session->attach_subscription(subscription.value());
  set_current(scan);

  if (!service_->start_inquiry()) {
    set_current(nullptr);
    auto handle = session->release_subscription();
    if (handle) {
      auto result = service_->unsubscribe(*handle);
      if (result.is_error()) {
        report(Error(ErrorCode::TeardownError,
                     "Failed to unsubscribe after refused inquiry",
                     result.error().to_string()));
      }
    }
    return Error(ErrorCode::StartFailed, "Platform refused to start inquiry");
  }

  return Result<void>::ok();
}

void ClassicScanner::cancel() {
  auto scan = current();
  if (!scan || !scan->session->begin_cancel()) {
    return;
  }

  if (!service_->cancel_inquiry()) {
    scan->report(Error(ErrorCode::TeardownError,
                       "Platform refused to cancel inquiry"));
  }

  // The finished event is not guaranteed after a cancel; finish here
  scan->finalize(CompletionReason::Cancelled, Error::ok());
}

} // namespace bluescan
