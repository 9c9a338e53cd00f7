/**
 * @file test_scanner.cpp
 * @brief Unit tests for the classic and low-energy scanners
 */

#include <gtest/gtest.h>
#include <bluescan/scanner.h>

#include "fakes/fake_radio.h"

#include <string>
#include <utility>
#include <vector>

using namespace bluescan;
using namespace bluescan::fakes;
using namespace std::chrono_literals;

namespace {

/// Collects everything a scanner reports, in order
struct Recorder {
  std::vector<DeviceRecord> found;
  std::vector<std::pair<CompletionReason, Error>> done;
  std::vector<Error> diagnostics;
  std::vector<std::string> events;

  FoundCallback on_found() {
    return [this](const DeviceRecord &device) {
      found.push_back(device);
      events.push_back("found:" + device.address());
    };
  }

  DoneCallback on_done() {
    return [this](CompletionReason reason, const Error &error) {
      done.emplace_back(reason, error);
      events.push_back(std::string("done:") + completion_reason_name(reason));
    };
  }

  DiagnosticCallback on_diagnostic() {
    return [this](const Error &error) { diagnostics.push_back(error); };
  }
};

} // namespace

// ============================================================================
// Classic Scanner
// ============================================================================

class ClassicScannerTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeClassicService> service =
      std::make_shared<FakeClassicService>();
  std::shared_ptr<RecordingPermissionSource> permissions =
      std::make_shared<RecordingPermissionSource>(RADIO_SCAN_PLATFORM_VERSION,
                                                  all_capabilities());
  std::shared_ptr<ManualExecutor> executor = std::make_shared<ManualExecutor>();
  ClassicScanner scanner{service, permissions, executor};
  Recorder recorder;

  void SetUp() override { scanner.on_diagnostic(recorder.on_diagnostic()); }

  std::shared_ptr<ScanSession> make_session(uint64_t id = 1) {
    return std::make_shared<ScanSession>(id, ScanMode::Classic);
  }

  Result<void> start(const std::shared_ptr<ScanSession> &session) {
    return scanner.start(session, recorder.on_found(), recorder.on_done());
  }
};

TEST_F(ClassicScannerTest, StartSubscribesAndStartsInquiry) {
  auto session = make_session();
  ASSERT_TRUE(start(session).is_ok());

  EXPECT_EQ(service->subscriber_count(), 1u);
  EXPECT_EQ(service->start_calls.load(), 1);
  EXPECT_TRUE(session->has_subscription());
  EXPECT_TRUE(scanner.is_running());
  EXPECT_EQ(scanner.mode(), ScanMode::Classic);
}

TEST_F(ClassicScannerTest, FoundDevicesArriveThroughExecutor) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_started();
  service->emit_found(make_raw("00:11:22:33:aa:bb", "Device 1", 0x5A020Cu));
  EXPECT_TRUE(recorder.found.empty());

  executor->run_pending();
  ASSERT_EQ(recorder.found.size(), 1u);
  EXPECT_EQ(recorder.found[0].name(), "Device 1");
  EXPECT_EQ(recorder.found[0].address(), "00:11:22:33:AA:BB");
  EXPECT_EQ(recorder.found[0].category(), "Phone");
}

TEST_F(ClassicScannerTest, NamelessDeviceUsesFallbackName) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_found(make_raw("23:45:67:89:AB:CD"));
  executor->run_pending();

  ASSERT_EQ(recorder.found.size(), 1u);
  EXPECT_EQ(recorder.found[0].name(), "UNKNOWN");
  EXPECT_EQ(recorder.found[0].category(), "Unknown Type");
}

TEST_F(ClassicScannerTest, EventWithoutDeviceIsIgnored) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_found_without_device();
  service->emit_found(make_raw(""));
  executor->run_pending();

  EXPECT_TRUE(recorder.found.empty());
  EXPECT_TRUE(recorder.done.empty());
}

TEST_F(ClassicScannerTest, BlankAddressIsIgnored) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_found(make_raw("   ", "Ghost"));
  service->emit_found(make_raw("\t00:11:22:33:aa:bb ", "Device 1"));
  executor->run_pending();

  ASSERT_EQ(recorder.found.size(), 1u);
  EXPECT_EQ(recorder.found[0].address(), "00:11:22:33:AA:BB");
}

TEST_F(ClassicScannerTest, FinishedEventCompletesAndUnsubscribes) {
  auto session = make_session();
  ASSERT_TRUE(start(session).is_ok());

  service->emit_found(make_raw("22:33:44:CC:DD:EE", "Device 2", 0x0100u));
  service->emit_finished();
  executor->run_pending();

  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Finished);
  EXPECT_TRUE(recorder.done[0].second.is_ok());
  EXPECT_EQ(recorder.events.back(), "done:Finished");

  EXPECT_EQ(session->state(), SessionState::Done);
  EXPECT_EQ(service->subscriber_count(), 0u);
  EXPECT_EQ(service->unsubscribe_calls.load(), 1);
  EXPECT_FALSE(scanner.is_running());
}

TEST_F(ClassicScannerTest, FinishedWithErrorReportsFailure) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_finished(Error(ErrorCode::RadioDisabled, "Adapter powered off"));
  executor->run_pending();

  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Failed);
  EXPECT_EQ(recorder.done[0].second.code, ErrorCode::ScanFailed);
  EXPECT_EQ(service->subscriber_count(), 0u);
}

TEST_F(ClassicScannerTest, CancelCompletesSynchronously) {
  auto session = make_session();
  ASSERT_TRUE(start(session).is_ok());

  scanner.cancel();

  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Cancelled);
  EXPECT_EQ(service->cancel_calls.load(), 1);
  EXPECT_EQ(service->subscriber_count(), 0u);
  EXPECT_EQ(session->state(), SessionState::Done);
}

TEST_F(ClassicScannerTest, QueuedResultsAreDroppedAfterCancel) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_found(make_raw("00:11:22:33:AA:BB", "Device 1"));
  scanner.cancel();
  executor->run_pending();

  EXPECT_TRUE(recorder.found.empty());
  ASSERT_EQ(recorder.events.size(), 1u);
  EXPECT_EQ(recorder.events[0], "done:Cancelled");
}

TEST_F(ClassicScannerTest, LateFinishedEventAfterCancelIsIgnored) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_finished();
  scanner.cancel();
  executor->run_pending();

  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Cancelled);
  EXPECT_EQ(service->unsubscribe_calls.load(), 1);
}

TEST_F(ClassicScannerTest, CancelWhenIdleIsNoOp) {
  scanner.cancel();
  EXPECT_EQ(service->cancel_calls.load(), 0);
  EXPECT_TRUE(recorder.done.empty());
}

TEST_F(ClassicScannerTest, RefusedCancelIsReportedButStillCompletes) {
  service->accept_cancel = false;
  ASSERT_TRUE(start(make_session()).is_ok());

  scanner.cancel();

  ASSERT_EQ(recorder.diagnostics.size(), 1u);
  EXPECT_EQ(recorder.diagnostics[0].code, ErrorCode::TeardownError);
  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Cancelled);
  EXPECT_EQ(service->subscriber_count(), 0u);
}

TEST_F(ClassicScannerTest, FailedUnsubscribeIsReported) {
  service->fail_unsubscribe = true;
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_finished();
  executor->run_pending();

  ASSERT_EQ(recorder.diagnostics.size(), 1u);
  EXPECT_EQ(recorder.diagnostics[0].code, ErrorCode::TeardownError);
  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Finished);
}

TEST_F(ClassicScannerTest, SubscribeFailureIsStartFailed) {
  service->fail_subscribe = true;

  auto result = start(make_session());
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::StartFailed);
  EXPECT_EQ(service->start_calls.load(), 0);
  EXPECT_FALSE(scanner.is_running());
}

TEST_F(ClassicScannerTest, RefusedInquiryUnsubscribes) {
  service->accept_start = false;
  auto session = make_session();

  auto result = start(session);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::StartFailed);

  EXPECT_EQ(service->subscriber_count(), 0u);
  EXPECT_EQ(service->unsubscribe_calls.load(), 1);
  EXPECT_FALSE(session->has_subscription());
  EXPECT_FALSE(scanner.is_running());
  EXPECT_TRUE(recorder.done.empty());
}

TEST_F(ClassicScannerTest, LocationRequiredOnOlderPlatforms) {
  auto older = std::make_shared<RecordingPermissionSource>(
      30, CapabilitySet{Capability::Radio, Capability::RadioAdmin});
  ClassicScanner legacy(service, older, executor);

  auto result =
      legacy.start(make_session(), recorder.on_found(), recorder.on_done());
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::PermissionDenied);
  EXPECT_EQ(service->subscribe_calls.load(), 0);
}

TEST_F(ClassicScannerTest, FineLocationSatisfiesOlderPlatforms) {
  auto older = std::make_shared<RecordingPermissionSource>(
      30, CapabilitySet{Capability::Radio, Capability::RadioAdmin,
                        Capability::FineLocation});
  ClassicScanner legacy(service, older, executor);

  EXPECT_TRUE(
      legacy.start(make_session(), recorder.on_found(), recorder.on_done())
          .is_ok());
}

TEST_F(ClassicScannerTest, SecondStartWhileRunningIsRejected) {
  ASSERT_TRUE(start(make_session(1)).is_ok());

  auto result = start(make_session(2));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ScanInProgress);
  EXPECT_EQ(service->subscriber_count(), 1u);
}

TEST_F(ClassicScannerTest, RejectsLowEnergySession) {
  auto session = std::make_shared<ScanSession>(1, ScanMode::LowEnergy);
  auto result = start(session);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ClassicScannerTest, CanScanAgainAfterCompletion) {
  ASSERT_TRUE(start(make_session(1)).is_ok());
  scanner.cancel();

  ASSERT_TRUE(start(make_session(2)).is_ok());
  EXPECT_EQ(service->subscriber_count(), 1u);
}

// ============================================================================
// Low Energy Scanner
// ============================================================================

class LowEnergyScannerTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeLowEnergyService> service =
      std::make_shared<FakeLowEnergyService>();
  std::shared_ptr<ManualExecutor> executor = std::make_shared<ManualExecutor>();
  LowEnergyScanner scanner{service, executor};
  Recorder recorder;

  void SetUp() override { scanner.on_diagnostic(recorder.on_diagnostic()); }

  std::shared_ptr<ScanSession> make_session(uint64_t id = 1) {
    return std::make_shared<ScanSession>(id, ScanMode::LowEnergy);
  }

  Result<void> start(const std::shared_ptr<ScanSession> &session) {
    return scanner.start(session, recorder.on_found(), recorder.on_done());
  }
};

TEST_F(LowEnergyScannerTest, DefaultTimeoutIsTwelveSeconds) {
  EXPECT_EQ(scanner.timeout(), Milliseconds(12000));
}

TEST_F(LowEnergyScannerTest, StartArmsTimeout) {
  ASSERT_TRUE(start(make_session()).is_ok());

  EXPECT_EQ(service->start_calls.load(), 1);
  EXPECT_TRUE(service->is_scanning());
  EXPECT_EQ(executor->timer_count(), 1u);
  EXPECT_TRUE(scanner.is_running());
}

TEST_F(LowEnergyScannerTest, TimeoutWithNoResults) {
  ASSERT_TRUE(start(make_session()).is_ok());

  executor->advance(11999ms);
  EXPECT_TRUE(recorder.done.empty());

  executor->advance(1ms);
  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::TimedOut);
  EXPECT_TRUE(recorder.found.empty());
  EXPECT_EQ(service->stop_calls.load(), 1);
  EXPECT_FALSE(service->is_scanning());
  EXPECT_FALSE(scanner.is_running());
}

TEST_F(LowEnergyScannerTest, ResultsPrecedeTimeout) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_result(make_raw("24:6f:13:57:ab:7e", "Tag"));
  executor->advance(6000ms);
  service->emit_result(make_raw("22:33:44:CC:DD:EE"));
  executor->advance(6000ms);

  std::vector<std::string> expected = {"found:24:6F:13:57:AB:7E",
                                       "found:22:33:44:CC:DD:EE",
                                       "done:TimedOut"};
  EXPECT_EQ(recorder.events, expected);
  EXPECT_EQ(recorder.found[1].name(), "UNKNOWN");
}

TEST_F(LowEnergyScannerTest, ResultQueuedBeforeDeadlineIsDelivered) {
  ASSERT_TRUE(start(make_session()).is_ok());

  executor->advance(11999ms);
  service->emit_result(make_raw("00:11:22:33:AA:BB", "Device 1"));
  executor->advance(1ms);

  ASSERT_EQ(recorder.events.size(), 2u);
  EXPECT_EQ(recorder.events[0], "found:00:11:22:33:AA:BB");
  EXPECT_EQ(recorder.events[1], "done:TimedOut");
}

TEST_F(LowEnergyScannerTest, ResultWithoutDeviceIsIgnored) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_result_without_device();
  executor->run_pending();

  EXPECT_TRUE(recorder.found.empty());
}

TEST_F(LowEnergyScannerTest, BlankAddressIsIgnored) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_result(make_raw(" \t "));
  service->emit_result(make_raw(""));
  executor->run_pending();

  EXPECT_TRUE(recorder.found.empty());
}

TEST_F(LowEnergyScannerTest, CancelStopsScanAndTimer) {
  ASSERT_TRUE(start(make_session()).is_ok());

  scanner.cancel();

  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Cancelled);
  EXPECT_EQ(service->stop_calls.load(), 1);
  EXPECT_EQ(executor->timer_count(), 0u);

  executor->advance(20000ms);
  EXPECT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(service->stop_calls.load(), 1);
}

TEST_F(LowEnergyScannerTest, CancelAtTheDeadlineCompletesOnce) {
  // Queued at the same instant as the timeout, and ahead of it
  executor->post_delayed(12000ms, [this]() { scanner.cancel(); });
  ASSERT_TRUE(start(make_session()).is_ok());

  executor->advance(12000ms);

  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Cancelled);
  EXPECT_EQ(service->stop_calls.load(), 1);
}

TEST_F(LowEnergyScannerTest, CancelAfterTimeoutIsNoOp) {
  ASSERT_TRUE(start(make_session()).is_ok());
  executor->advance(12000ms);

  scanner.cancel();

  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::TimedOut);
  EXPECT_EQ(service->stop_calls.load(), 1);
}

TEST_F(LowEnergyScannerTest, QueuedResultsAreDroppedAfterCancel) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_result(make_raw("00:11:22:33:AA:BB", "Device 1"));
  scanner.cancel();
  executor->run_pending();

  EXPECT_TRUE(recorder.found.empty());
}

TEST_F(LowEnergyScannerTest, PlatformFailureEndsScan) {
  ASSERT_TRUE(start(make_session()).is_ok());

  service->emit_failure(Error(ErrorCode::PlatformError, "Scan failed: 2"));
  executor->run_pending();

  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::Failed);
  EXPECT_EQ(recorder.done[0].second.code, ErrorCode::ScanFailed);
  EXPECT_EQ(service->stop_calls.load(), 1);
  EXPECT_EQ(executor->timer_count(), 0u);
}

TEST_F(LowEnergyScannerTest, StartFailureArmsNothing) {
  service->fail_start = true;

  auto result = start(make_session());
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::StartFailed);
  EXPECT_EQ(executor->timer_count(), 0u);
  EXPECT_FALSE(scanner.is_running());
}

TEST_F(LowEnergyScannerTest, FailedStopIsReported) {
  service->fail_stop = true;
  ASSERT_TRUE(start(make_session()).is_ok());

  scanner.cancel();

  ASSERT_EQ(recorder.diagnostics.size(), 1u);
  EXPECT_EQ(recorder.diagnostics[0].code, ErrorCode::TeardownError);
  EXPECT_EQ(recorder.done.size(), 1u);
}

TEST_F(LowEnergyScannerTest, CustomTimeout) {
  LowEnergyScanner quick(service, executor, Milliseconds(5000));
  ASSERT_TRUE(
      quick.start(make_session(), recorder.on_found(), recorder.on_done())
          .is_ok());

  executor->advance(5000ms);
  ASSERT_EQ(recorder.done.size(), 1u);
  EXPECT_EQ(recorder.done[0].first, CompletionReason::TimedOut);
}

TEST_F(LowEnergyScannerTest, RejectsClassicSession) {
  auto session = std::make_shared<ScanSession>(1, ScanMode::Classic);
  auto result = start(session);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}
