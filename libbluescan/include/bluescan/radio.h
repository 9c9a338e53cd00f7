/**
 * @file radio.h
 * @brief Platform radio services used by the scanners
 *
 * The radio stack is an external collaborator. Scanners only see these
 * interfaces; the Linux implementation talks to BlueZ over D-Bus, tests use
 * in-memory fakes.
 *
 * Callbacks registered here may be invoked on any platform thread.
 */

#ifndef BLUESCAN_RADIO_H
#define BLUESCAN_RADIO_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <functional>
#include <memory>
#include <optional>
#include <set>

namespace bluescan {

class PermissionSource;

// ============================================================================
// Adapter
// ============================================================================

/**
 * @brief Presence and power state of the local radio
 */
class BLUESCAN_API RadioAdapter {
public:
  virtual ~RadioAdapter() = default;

  /// An adapter exists
  virtual bool is_present() const = 0;

  /// The adapter is powered on
  virtual bool is_enabled() const = 0;
};

// ============================================================================
// Classic (inquiry) Service
// ============================================================================

/// Event kinds a classic subscription can ask for
enum class ClassicEventKind : uint8_t {
  DiscoveryStarted = 0,
  DeviceFound = 1,
  DiscoveryFinished = 2
};

/**
 * @brief One event from the classic inquiry service
 */
struct ClassicEvent {
  ClassicEventKind kind = ClassicEventKind::DiscoveryStarted;

  /// Set for DeviceFound; may be absent if the platform lost the handle
  std::optional<RawDevice> device;

  /// Set on DiscoveryFinished when the inquiry ended abnormally
  std::optional<Error> error;
};

using ClassicEventHandler = std::function<void(const ClassicEvent &)>;

/**
 * @brief Event-subscription interface to inquiry-based discovery
 *
 * A subscription stays registered until unsubscribe() is called; the
 * platform never drops it on its own.
 */
class BLUESCAN_API ClassicRadioService {
public:
  virtual ~ClassicRadioService() = default;

  virtual Result<SubscriptionHandle>
  subscribe(const std::set<ClassicEventKind> &kinds,
            ClassicEventHandler handler) = 0;

  virtual Result<void> unsubscribe(SubscriptionHandle handle) = 0;

  /// Begin an inquiry window. False if the platform refused.
  virtual bool start_inquiry() = 0;

  /// Abort the running inquiry. A finished event is not guaranteed after.
  virtual bool cancel_inquiry() = 0;
};

// ============================================================================
// Low Energy (advertisement) Service
// ============================================================================

/**
 * @brief One advertisement seen by the low-energy scanner
 */
struct LowEnergyScanResult {
  /// Device that sent the advertisement; absent if it could not be resolved
  std::optional<RawDevice> device;
};

using LowEnergyResultHandler = std::function<void(const LowEnergyScanResult &)>;
using LowEnergyFailureHandler = std::function<void(const Error &)>;

/**
 * @brief Callback interface to advertisement-based discovery
 *
 * There is no natural end to a low-energy scan; it runs until stop_scan().
 */
class BLUESCAN_API LowEnergyRadioService {
public:
  virtual ~LowEnergyRadioService() = default;

  virtual Result<SubscriptionHandle>
  start_scan(LowEnergyResultHandler on_result,
             LowEnergyFailureHandler on_failed) = 0;

  virtual Result<void> stop_scan(SubscriptionHandle handle) = 0;
};

// ============================================================================
// Platform Bundle
// ============================================================================

/**
 * @brief Everything the scan coordinator needs from the platform
 */
struct RadioPlatform {
  std::shared_ptr<RadioAdapter> adapter;
  std::shared_ptr<ClassicRadioService> classic;
  std::shared_ptr<LowEnergyRadioService> low_energy;
  std::shared_ptr<PermissionSource> permissions;

  /// All four collaborators are set
  bool is_complete() const {
    return adapter && classic && low_energy && permissions;
  }
};

} // namespace bluescan

#endif // BLUESCAN_RADIO_H
