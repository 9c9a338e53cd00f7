/**
 * @file device.h
 * @brief Normalized device records and device-class categories
 *
 * Every platform discovery event, classic or low-energy, is turned into
 * exactly one DeviceRecord. Records are compared by hardware address only,
 * so a device whose name changes between events is still the same device.
 */

#ifndef BLUESCAN_DEVICE_H
#define BLUESCAN_DEVICE_H

#include "platform.h"
#include "types.h"
#include <cstdint>
#include <optional>
#include <string>

namespace bluescan {

// ============================================================================
// Device Categories
// ============================================================================

/// Category strings produced by classify_device_class()
namespace category {
constexpr const char *COMPUTER = "Computer";
constexpr const char *PHONE = "Phone";
constexpr const char *AUDIO_VIDEO = "Audio/Video";
constexpr const char *PERIPHERAL = "Peripheral";
constexpr const char *IMAGING = "Imaging Device";
constexpr const char *HEALTH = "Health Device";
constexpr const char *UNKNOWN = "Unknown Type";
} // namespace category

/// Major device class values (bits 8-12 of the Class of Device)
enum class MajorDeviceClass : uint32_t {
  Miscellaneous = 0x0000,
  Computer = 0x0100,
  Phone = 0x0200,
  Networking = 0x0300,
  AudioVideo = 0x0400,
  Peripheral = 0x0500,
  Imaging = 0x0600,
  Wearable = 0x0700,
  Toy = 0x0800,
  Health = 0x0900,
  Uncategorized = 0x1F00
};

/// Mask selecting the major device class from a Class of Device
constexpr uint32_t MAJOR_DEVICE_CLASS_MASK = 0x1F00;

/**
 * @brief Map a raw Class of Device to a coarse human category
 * @param class_code Class of Device, or nullopt if the platform gave none
 * @return One of the category:: strings; never empty
 *
 * Total over the code space: anything unrecognized is "Unknown Type".
 */
BLUESCAN_API std::string
classify_device_class(std::optional<uint32_t> class_code);

// ============================================================================
// Device Record
// ============================================================================

/**
 * @brief Normalized, immutable description of a discovered device
 */
class BLUESCAN_API DeviceRecord {
public:
  /// Name used when the platform does not report one
  static constexpr const char *UNKNOWN_NAME = "UNKNOWN";

  DeviceRecord(std::string name, std::string address, std::string category);

  /**
   * @brief Build a record from a platform event
   * @param raw Device as reported by the radio service
   * @param fallback_name Name to use when raw.name is absent or empty
   */
  static DeviceRecord from_raw(const RawDevice &raw,
                               const std::string &fallback_name =
                                   UNKNOWN_NAME);

  const std::string &name() const { return name_; }
  const std::string &address() const { return address_; }
  const std::string &category() const { return category_; }

  /// Identity is the hardware address alone
  bool operator==(const DeviceRecord &other) const {
    return address_ == other.address_;
  }
  bool operator!=(const DeviceRecord &other) const {
    return !(*this == other);
  }

private:
  std::string name_;
  std::string address_;
  std::string category_;
};

/// Canonical form of a hardware address (upper-case hex, ':' separated)
BLUESCAN_API std::string normalize_address(const std::string &address);

} // namespace bluescan

#endif // BLUESCAN_DEVICE_H
