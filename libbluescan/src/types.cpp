/**
 * @file types.cpp
 * @brief Names and conversions for core types
 */

#include "bluescan/types.h"

namespace bluescan {

const char *scan_mode_name(ScanMode mode) {
  switch (mode) {
  case ScanMode::Classic:
    return "Classic";
  case ScanMode::LowEnergy:
    return "LowEnergy";
  default:
    return "Unknown";
  }
}

const char *session_state_name(SessionState state) {
  switch (state) {
  case SessionState::Idle:
    return "Idle";
  case SessionState::Running:
    return "Running";
  case SessionState::Cancelling:
    return "Cancelling";
  case SessionState::Done:
    return "Done";
  default:
    return "Unknown";
  }
}

const char *completion_reason_name(CompletionReason reason) {
  switch (reason) {
  case CompletionReason::Finished:
    return "Finished";
  case CompletionReason::TimedOut:
    return "TimedOut";
  case CompletionReason::Cancelled:
    return "Cancelled";
  case CompletionReason::Failed:
    return "Failed";
  default:
    return "Unknown";
  }
}

// ============================================================================
// Capabilities
// ============================================================================

const char *capability_name(Capability capability) {
  switch (capability) {
  case Capability::Radio:
    return "RADIO";
  case Capability::RadioAdmin:
    return "RADIO_ADMIN";
  case Capability::RadioScan:
    return "RADIO_SCAN";
  case Capability::CoarseLocation:
    return "COARSE_LOCATION";
  case Capability::FineLocation:
    return "FINE_LOCATION";
  default:
    return "UNKNOWN";
  }
}

std::optional<Capability> capability_from_name(const std::string &name) {
  static const Capability all[] = {
      Capability::Radio, Capability::RadioAdmin, Capability::RadioScan,
      Capability::CoarseLocation, Capability::FineLocation};

  for (Capability c : all) {
    if (name == capability_name(c)) {
      return c;
    }
  }
  return std::nullopt;
}

std::string capabilities_to_string(const CapabilitySet &set) {
  std::string out;
  for (Capability c : set) {
    if (!out.empty()) {
      out += ",";
    }
    out += capability_name(c);
  }
  return out;
}

} // namespace bluescan
