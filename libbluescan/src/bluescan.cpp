/**
 * @file bluescan.cpp
 * @brief Platform selection
 */

#include "bluescan/bluescan.h"

#if defined(BLUESCAN_RADIO_BLUEZ)
#include "platform/linux/bluez_radio.h"
#endif

namespace bluescan {

Result<RadioPlatform> create_platform(const ScanConfig &config) {
#if defined(BLUESCAN_RADIO_BLUEZ)
  return platform::make_bluez_platform(config);
#else
  BLUESCAN_UNUSED(config);
  return Error(ErrorCode::NotSupported,
               "Built without a radio backend for this platform");
#endif
}

} // namespace bluescan
