/**
 * @file bluescan.h
 * @brief Main BlueScan API Header
 *
 * BlueScan discovers nearby Bluetooth devices with either a classic inquiry
 * or a low-energy advertisement scan, and streams each device to the caller
 * the first time it is seen.
 *
 * Quick Start:
 * @code
 *   #include <bluescan/bluescan.h>
 *
 *   bluescan::ConfigManager config;
 *   config.init();
 *
 *   auto platform = bluescan::create_platform(config.get());
 *   auto executor = std::make_shared<bluescan::SerialExecutor>();
 *   bluescan::ScanCoordinator scanner(platform.value(), executor,
 *                                     config.get());
 *
 *   scanner.on_device_found([](const bluescan::DeviceRecord &d) {
 *       std::cout << d.name() << " " << d.address() << std::endl;
 *   });
 *
 *   scanner.start_scan(bluescan::ScanMode::Classic);
 * @endcode
 */

#ifndef BLUESCAN_BLUESCAN_H
#define BLUESCAN_BLUESCAN_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "config.h"
#include "coordinator.h"
#include "device.h"
#include "executor.h"
#include "permission.h"
#include "radio.h"
#include "scanner.h"
#include "session.h"

namespace bluescan {

// ============================================================================
// Version Information
// ============================================================================

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "1.0.0";

// ============================================================================
// Platform
// ============================================================================

/**
 * @brief Radio services for the machine this runs on
 *
 * On Linux with BlueZ support compiled in, connects to the system bus and
 * picks the adapter named in @p config (or the first one). Grants come from
 * config.granted_capabilities.
 *
 * @return NotSupported when built without a radio backend;
 *         ServiceUnavailable when the radio daemon cannot be reached
 */
BLUESCAN_API Result<RadioPlatform> create_platform(const ScanConfig &config);

} // namespace bluescan

#endif // BLUESCAN_BLUESCAN_H
