/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "bluescan/error.h"
#include <sstream>

namespace bluescan {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::ScanInProgress:
    return "ScanInProgress";
  case ErrorCode::StartFailed:
    return "StartFailed";
  case ErrorCode::ScanFailed:
    return "ScanFailed";
  case ErrorCode::TeardownError:
    return "TeardownError";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::RadioUnavailable:
    return "RadioUnavailable";
  case ErrorCode::RadioDisabled:
    return "RadioDisabled";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";

  case ErrorCode::ConfigParseError:
    return "ConfigParseError";
  case ErrorCode::FileReadError:
    return "FileReadError";
  case ErrorCode::FileWriteError:
    return "FileWriteError";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::NotFound:
    return "Requested object not found";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::ScanInProgress:
    return "A scan is already running";
  case ErrorCode::StartFailed:
    return "The radio refused to start discovery";
  case ErrorCode::ScanFailed:
    return "Discovery failed while running";
  case ErrorCode::TeardownError:
    return "Failed to release the discovery subscription";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::PermissionDenied:
    return "Required permission not granted";
  case ErrorCode::RadioUnavailable:
    return "No Bluetooth adapter available";
  case ErrorCode::RadioDisabled:
    return "Bluetooth adapter is powered off";
  case ErrorCode::ServiceUnavailable:
    return "Required service unavailable";

  case ErrorCode::ConfigParseError:
    return "Configuration file is malformed";
  case ErrorCode::FileReadError:
    return "Error reading file";
  case ErrorCode::FileWriteError:
    return "Error writing file";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::NotSupported:
  case ErrorCode::RadioUnavailable:
  case ErrorCode::ConfigParseError:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace bluescan
