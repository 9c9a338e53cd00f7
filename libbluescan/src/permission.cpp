/**
 * @file permission.cpp
 * @brief Permission gate implementation
 */

#include "bluescan/permission.h"

namespace bluescan {

// ============================================================================
// PermissionGate
// ============================================================================

bool PermissionGate::requires_location(int platform_version) {
  return platform_version < RADIO_SCAN_PLATFORM_VERSION;
}

CapabilitySet PermissionGate::required_capabilities(int platform_version) {
  if (requires_location(platform_version)) {
    return {Capability::Radio, Capability::RadioAdmin,
            Capability::CoarseLocation};
  }
  return {Capability::Radio, Capability::RadioAdmin, Capability::RadioScan};
}

CapabilitySet
PermissionGate::missing_capabilities(int platform_version,
                                     const CapabilitySet &granted) {
  CapabilitySet missing;
  for (Capability c : required_capabilities(platform_version)) {
    if (granted.count(c)) {
      continue;
    }
    // A fine location grant covers the coarse one
    if (c == Capability::CoarseLocation &&
        granted.count(Capability::FineLocation)) {
      continue;
    }
    missing.insert(c);
  }
  return missing;
}

bool PermissionGate::has_sufficient_permissions(int platform_version,
                                                const CapabilitySet &granted) {
  return missing_capabilities(platform_version, granted).empty();
}

bool PermissionGate::has_location_capability(const CapabilitySet &granted) {
  return granted.count(Capability::CoarseLocation) ||
         granted.count(Capability::FineLocation);
}

// ============================================================================
// StaticPermissionSource
// ============================================================================

StaticPermissionSource::StaticPermissionSource(int platform_version,
                                               CapabilitySet granted)
    : platform_version_(platform_version), granted_(std::move(granted)) {}

int StaticPermissionSource::platform_version() const {
  return platform_version_;
}

CapabilitySet StaticPermissionSource::granted_capabilities() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return granted_;
}

void StaticPermissionSource::request_capabilities(
    const CapabilitySet &capabilities, std::function<void()> on_complete) {
  BLUESCAN_UNUSED(capabilities);
  if (on_complete) {
    on_complete();
  }
}

void StaticPermissionSource::set_granted(CapabilitySet granted) {
  std::lock_guard<std::mutex> lock(mutex_);
  granted_ = std::move(granted);
}

} // namespace bluescan
