/**
 * @file permission.h
 * @brief Capability requirements for scanning
 *
 * The permission gate is a pure function of the platform version and the
 * grants currently held. Asking the user for grants is the job of a
 * PermissionSource; the gate only decides whether to ask and for what.
 */

#ifndef BLUESCAN_PERMISSION_H
#define BLUESCAN_PERMISSION_H

#include "platform.h"
#include "types.h"
#include <functional>
#include <mutex>

namespace bluescan {

// ============================================================================
// Permission Gate
// ============================================================================

/**
 * @brief Platform version from which RADIO_SCAN replaces the location grant
 *
 * Below this version scanning needs {RADIO, RADIO_ADMIN, COARSE_LOCATION};
 * at or above it, {RADIO, RADIO_ADMIN, RADIO_SCAN}.
 */
constexpr int RADIO_SCAN_PLATFORM_VERSION = 31;

/**
 * @brief Pure capability predicate
 */
class BLUESCAN_API PermissionGate {
public:
  /// Capabilities a scan needs on the given platform version
  static CapabilitySet required_capabilities(int platform_version);

  /**
   * @brief Required capabilities that are not in @p granted
   * @return Empty set if scanning is allowed
   */
  static CapabilitySet missing_capabilities(int platform_version,
                                            const CapabilitySet &granted);

  static bool has_sufficient_permissions(int platform_version,
                                         const CapabilitySet &granted);

  /// True if coarse or fine location is granted
  static bool has_location_capability(const CapabilitySet &granted);

  /// True if the platform version still ties inquiry to location
  static bool requires_location(int platform_version);
};

// ============================================================================
// Permission Source
// ============================================================================

/**
 * @brief Where the current grants come from, and how to ask for more
 */
class BLUESCAN_API PermissionSource {
public:
  virtual ~PermissionSource() = default;

  /// Version of the running platform (API level on Android)
  virtual int platform_version() const = 0;

  /// Capabilities currently granted
  virtual CapabilitySet granted_capabilities() const = 0;

  /**
   * @brief Ask the user/OS for capabilities
   * @param capabilities What to request
   * @param on_complete Fired asynchronously once the request settles;
   *                    re-check through PermissionGate afterwards
   */
  virtual void request_capabilities(const CapabilitySet &capabilities,
                                    std::function<void()> on_complete) = 0;
};

/**
 * @brief PermissionSource backed by a fixed grant list
 *
 * Desktop Linux has no runtime grant dialog; access to the radio is decided
 * by D-Bus policy. The grant list comes from ScanConfig.
 */
class BLUESCAN_API StaticPermissionSource : public PermissionSource {
public:
  StaticPermissionSource(int platform_version, CapabilitySet granted);

  int platform_version() const override;
  CapabilitySet granted_capabilities() const override;

  /// Nothing can be granted at runtime; completes immediately
  void request_capabilities(const CapabilitySet &capabilities,
                            std::function<void()> on_complete) override;

  void set_granted(CapabilitySet granted);

private:
  mutable std::mutex mutex_;
  int platform_version_;
  CapabilitySet granted_;
};

} // namespace bluescan

#endif // BLUESCAN_PERMISSION_H
