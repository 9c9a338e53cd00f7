/**
 * @file types.h
 * @brief Core type definitions for BlueScan
 */

#ifndef BLUESCAN_TYPES_H
#define BLUESCAN_TYPES_H

#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace bluescan {

// ============================================================================
// Scan Modes and States
// ============================================================================

/// Which discovery mechanism a scan uses
enum class ScanMode : uint8_t {
  Classic = 0,  // Inquiry-based (BR/EDR)
  LowEnergy = 1 // Advertisement-based (BLE)
};

/// Lifecycle state of one scan session
enum class SessionState : uint8_t {
  Idle = 0,
  Running = 1,
  Cancelling = 2,
  Done = 3
};

/// Why a session ended
enum class CompletionReason : uint8_t {
  Finished = 0,  // Platform reported end of inquiry
  TimedOut = 1,  // Low-energy timeout elapsed
  Cancelled = 2, // cancel_scan() was called
  Failed = 3     // Platform failure mid-scan
};

BLUESCAN_API const char *scan_mode_name(ScanMode mode);
BLUESCAN_API const char *session_state_name(SessionState state);
BLUESCAN_API const char *completion_reason_name(CompletionReason reason);

// ============================================================================
// Capabilities
// ============================================================================

/// A named permission grant required before a radio operation
enum class Capability : uint8_t {
  Radio = 0,
  RadioAdmin = 1,
  RadioScan = 2,
  CoarseLocation = 3,
  FineLocation = 4
};

using CapabilitySet = std::set<Capability>;

BLUESCAN_API const char *capability_name(Capability capability);

/// Parse a capability name as written by capability_name()
BLUESCAN_API std::optional<Capability>
capability_from_name(const std::string &name);

/// Comma-separated list of capability names (stable order)
BLUESCAN_API std::string capabilities_to_string(const CapabilitySet &set);

// ============================================================================
// Platform Handles
// ============================================================================

/// Opaque token for a platform event registration or running scan
using SubscriptionHandle = uint64_t;

/// Device as reported by a platform radio service, before normalization
struct RawDevice {
  std::string address;                // Hardware address ("AA:BB:CC:DD:EE:FF")
  std::optional<std::string> name;    // Absent if unknown or not permitted
  std::optional<uint32_t> class_code; // Class of Device, if reported
  std::optional<int> rssi_dbm;
};

using Clock = std::chrono::steady_clock;
using Milliseconds = std::chrono::milliseconds;

} // namespace bluescan

#endif // BLUESCAN_TYPES_H
