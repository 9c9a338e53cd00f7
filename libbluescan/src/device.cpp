/**
 * @file device.cpp
 * @brief Device record and category classifier
 */

#include "bluescan/device.h"
#include <algorithm>
#include <cctype>

namespace bluescan {

// ============================================================================
// Category Classifier
// ============================================================================

std::string classify_device_class(std::optional<uint32_t> class_code) {
  if (!class_code) {
    return category::UNKNOWN;
  }

  switch (static_cast<MajorDeviceClass>(*class_code &
                                        MAJOR_DEVICE_CLASS_MASK)) {
  case MajorDeviceClass::Computer:
    return category::COMPUTER;
  case MajorDeviceClass::Phone:
    return category::PHONE;
  case MajorDeviceClass::AudioVideo:
    return category::AUDIO_VIDEO;
  case MajorDeviceClass::Peripheral:
    return category::PERIPHERAL;
  case MajorDeviceClass::Imaging:
    return category::IMAGING;
  case MajorDeviceClass::Health:
    return category::HEALTH;
  default:
    return category::UNKNOWN;
  }
}

// ============================================================================
// DeviceRecord
// ============================================================================

DeviceRecord::DeviceRecord(std::string name, std::string address,
                           std::string category)
    : name_(std::move(name)), address_(std::move(address)),
      category_(std::move(category)) {}

DeviceRecord DeviceRecord::from_raw(const RawDevice &raw,
                                    const std::string &fallback_name) {
  std::string name =
      (raw.name && !raw.name->empty()) ? *raw.name : fallback_name;

  return DeviceRecord(std::move(name), normalize_address(raw.address),
                      classify_device_class(raw.class_code));
}

std::string normalize_address(const std::string &address) {
  std::string out;
  out.reserve(address.size());

  for (char c : address) {
    if (c == '-' || c == '_') {
      out += ':';
    } else {
      out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
  }

  // Trim surrounding whitespace
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  out.erase(out.begin(), std::find_if(out.begin(), out.end(), not_space));
  out.erase(std::find_if(out.rbegin(), out.rend(), not_space).base(),
            out.end());
  return out;
}

} // namespace bluescan
