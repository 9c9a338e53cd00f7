/**
 * @file fake_radio.h
 * @brief In-memory radio services and a virtual-time executor for tests
 */

#ifndef BLUESCAN_TESTS_FAKE_RADIO_H
#define BLUESCAN_TESTS_FAKE_RADIO_H

#include <bluescan/executor.h>
#include <bluescan/permission.h>
#include <bluescan/radio.h>

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace bluescan {
namespace fakes {

inline RawDevice make_raw(const std::string &address,
                          std::optional<std::string> name = std::nullopt,
                          std::optional<uint32_t> class_code = std::nullopt) {
  RawDevice raw;
  raw.address = address;
  raw.name = std::move(name);
  raw.class_code = class_code;
  return raw;
}

// ============================================================================
// Manual Executor
// ============================================================================

/**
 * @brief Executor that runs nothing until told to
 *
 * Time is virtual: delayed tasks fall due only through advance(). A due
 * timer joins the back of the queue, behind everything already posted.
 */
class ManualExecutor : public Executor {
public:
  void post(Task task) override {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(task));
  }

  TimerId post_delayed(Milliseconds delay, Task task) override {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_timer_id_++;
    timers_.emplace(TimerKey(now_ + delay, id), std::move(task));
    return id;
  }

  bool cancel(TimerId id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->first.second == id) {
        timers_.erase(it);
        return true;
      }
    }
    return false;
  }

  /// Run queued tasks, including tasks they post, until the queue is empty
  size_t run_pending() {
    size_t ran = 0;
    for (;;) {
      Task task;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
          return ran;
        }
        task = std::move(queue_.front());
        queue_.pop_front();
      }
      if (task) {
        task();
      }
      ++ran;
    }
  }

  /// Move virtual time forward, firing due timers in deadline order
  void advance(Milliseconds delta) {
    Milliseconds target;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      target = now_ + delta;
    }

    for (;;) {
      run_pending();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (timers_.empty() || timers_.begin()->first.first > target) {
          now_ = target;
          break;
        }
        auto it = timers_.begin();
        now_ = it->first.first;
        queue_.push_back(std::move(it->second));
        timers_.erase(it);
      }
    }
    run_pending();
  }

  Milliseconds now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }

  size_t queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t timer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
  }

private:
  using TimerKey = std::pair<Milliseconds, TimerId>;

  mutable std::mutex mutex_;
  std::deque<Task> queue_;
  std::map<TimerKey, Task> timers_;
  Milliseconds now_{0};
  TimerId next_timer_id_ = 1;
};

// ============================================================================
// Fake Adapter
// ============================================================================

class FakeAdapter : public RadioAdapter {
public:
  bool is_present() const override { return present; }
  bool is_enabled() const override { return enabled; }

  std::atomic<bool> present{true};
  std::atomic<bool> enabled{true};
};

// ============================================================================
// Fake Classic Service
// ============================================================================

class FakeClassicService : public ClassicRadioService {
public:
  Result<SubscriptionHandle> subscribe(const std::set<ClassicEventKind> &kinds,
                                       ClassicEventHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++subscribe_calls;
    if (fail_subscribe) {
      return Error(ErrorCode::PlatformError, "Receiver registration refused");
    }
    SubscriptionHandle handle = next_handle_++;
    subscribers_[handle] = Subscriber{kinds, std::move(handler)};
    return handle;
  }

  Result<void> unsubscribe(SubscriptionHandle handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++unsubscribe_calls;
    if (subscribers_.erase(handle) == 0) {
      return Error(ErrorCode::NotFound, "Unknown subscription");
    }
    if (fail_unsubscribe) {
      return Error(ErrorCode::PlatformError, "Receiver was not registered");
    }
    return Result<void>::ok();
  }

  bool start_inquiry() override {
    ++start_calls;
    inquiring = accept_start.load();
    return accept_start;
  }

  bool cancel_inquiry() override {
    ++cancel_calls;
    inquiring = false;
    return accept_cancel;
  }

  /// Deliver @p event to every subscriber registered for its kind
  void emit(const ClassicEvent &event) {
    std::vector<ClassicEventHandler> handlers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto &entry : subscribers_) {
        if (entry.second.kinds.count(event.kind)) {
          handlers.push_back(entry.second.handler);
        }
      }
    }
    for (const auto &handler : handlers) {
      handler(event);
    }
  }

  void emit_started() {
    ClassicEvent event;
    event.kind = ClassicEventKind::DiscoveryStarted;
    emit(event);
  }

  void emit_found(const RawDevice &device) {
    ClassicEvent event;
    event.kind = ClassicEventKind::DeviceFound;
    event.device = device;
    emit(event);
  }

  void emit_found_without_device() {
    ClassicEvent event;
    event.kind = ClassicEventKind::DeviceFound;
    emit(event);
  }

  void emit_finished(std::optional<Error> error = std::nullopt) {
    ClassicEvent event;
    event.kind = ClassicEventKind::DiscoveryFinished;
    event.error = std::move(error);
    emit(event);
  }

  size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

  std::atomic<bool> fail_subscribe{false};
  std::atomic<bool> fail_unsubscribe{false};
  std::atomic<bool> accept_start{true};
  std::atomic<bool> accept_cancel{true};
  std::atomic<bool> inquiring{false};

  std::atomic<int> subscribe_calls{0};
  std::atomic<int> unsubscribe_calls{0};
  std::atomic<int> start_calls{0};
  std::atomic<int> cancel_calls{0};

private:
  struct Subscriber {
    std::set<ClassicEventKind> kinds;
    ClassicEventHandler handler;
  };

  mutable std::mutex mutex_;
  std::map<SubscriptionHandle, Subscriber> subscribers_;
  SubscriptionHandle next_handle_ = 1;
};

// ============================================================================
// Fake Low Energy Service
// ============================================================================

class FakeLowEnergyService : public LowEnergyRadioService {
public:
  Result<SubscriptionHandle> start_scan(LowEnergyResultHandler on_result,
                                        LowEnergyFailureHandler on_failed) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++start_calls;
    if (fail_start) {
      return Error(ErrorCode::PlatformError, "Scanner unavailable");
    }
    active_ = next_handle_++;
    on_result_ = std::move(on_result);
    on_failed_ = std::move(on_failed);
    return *active_;
  }

  Result<void> stop_scan(SubscriptionHandle handle) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stop_calls;
    if (!active_ || *active_ != handle) {
      return Error(ErrorCode::NotFound, "Unknown scan handle");
    }
    active_.reset();
    on_result_ = nullptr;
    on_failed_ = nullptr;
    if (fail_stop) {
      return Error(ErrorCode::PlatformError, "Stop refused");
    }
    return Result<void>::ok();
  }

  void emit_result(const RawDevice &device) {
    LowEnergyScanResult result;
    result.device = device;
    deliver(result);
  }

  void emit_result_without_device() { deliver(LowEnergyScanResult{}); }

  void emit_failure(const Error &error) {
    LowEnergyFailureHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = on_failed_;
    }
    if (handler) {
      handler(error);
    }
  }

  bool is_scanning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.has_value();
  }

  std::atomic<bool> fail_start{false};
  std::atomic<bool> fail_stop{false};

  std::atomic<int> start_calls{0};
  std::atomic<int> stop_calls{0};

private:
  void deliver(const LowEnergyScanResult &result) {
    LowEnergyResultHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = on_result_;
    }
    if (handler) {
      handler(result);
    }
  }

  mutable std::mutex mutex_;
  std::optional<SubscriptionHandle> active_;
  LowEnergyResultHandler on_result_;
  LowEnergyFailureHandler on_failed_;
  SubscriptionHandle next_handle_ = 1;
};

// ============================================================================
// Recording Permission Source
// ============================================================================

/// StaticPermissionSource that remembers what was requested
class RecordingPermissionSource : public StaticPermissionSource {
public:
  using StaticPermissionSource::StaticPermissionSource;

  void request_capabilities(const CapabilitySet &capabilities,
                            std::function<void()> on_complete) override {
    {
      std::lock_guard<std::mutex> lock(requests_mutex_);
      requests_.push_back(capabilities);
    }
    StaticPermissionSource::request_capabilities(capabilities,
                                                 std::move(on_complete));
  }

  std::vector<CapabilitySet> requests() const {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return requests_;
  }

private:
  mutable std::mutex requests_mutex_;
  std::vector<CapabilitySet> requests_;
};

// ============================================================================
// Fake Platform
// ============================================================================

inline CapabilitySet all_capabilities() {
  return {Capability::Radio, Capability::RadioAdmin, Capability::RadioScan,
          Capability::CoarseLocation, Capability::FineLocation};
}

/// One of each fake, wired into a RadioPlatform
struct FakePlatform {
  std::shared_ptr<FakeAdapter> adapter = std::make_shared<FakeAdapter>();
  std::shared_ptr<FakeClassicService> classic =
      std::make_shared<FakeClassicService>();
  std::shared_ptr<FakeLowEnergyService> low_energy =
      std::make_shared<FakeLowEnergyService>();
  std::shared_ptr<RecordingPermissionSource> permissions =
      std::make_shared<RecordingPermissionSource>(RADIO_SCAN_PLATFORM_VERSION,
                                                  all_capabilities());

  RadioPlatform platform() const {
    RadioPlatform p;
    p.adapter = adapter;
    p.classic = classic;
    p.low_energy = low_energy;
    p.permissions = permissions;
    return p;
  }
};

} // namespace fakes
} // namespace bluescan

#endif // BLUESCAN_TESTS_FAKE_RADIO_H
