/**
 * @file test_device.cpp
 * @brief Unit tests for device records and the category classifier
 */

#include <gtest/gtest.h>
#include <bluescan/device.h>

using namespace bluescan;

// ============================================================================
// Category Classifier
// ============================================================================

TEST(ClassifierTest, MajorClassesMapToCategories) {
  EXPECT_EQ(classify_device_class(0x0100u), category::COMPUTER);
  EXPECT_EQ(classify_device_class(0x0200u), category::PHONE);
  EXPECT_EQ(classify_device_class(0x0400u), category::AUDIO_VIDEO);
  EXPECT_EQ(classify_device_class(0x0500u), category::PERIPHERAL);
  EXPECT_EQ(classify_device_class(0x0600u), category::IMAGING);
  EXPECT_EQ(classify_device_class(0x0900u), category::HEALTH);
}

TEST(ClassifierTest, MinorAndServiceBitsAreIgnored) {
  // Smartphone: service bits + Phone major + cellular minor
  EXPECT_EQ(classify_device_class(0x5A020Cu), category::PHONE);
  // Laptop
  EXPECT_EQ(classify_device_class(0x10010Cu), category::COMPUTER);
  // Headset
  EXPECT_EQ(classify_device_class(0x240404u), category::AUDIO_VIDEO);
}

TEST(ClassifierTest, UnhandledMajorsAreUnknown) {
  EXPECT_EQ(classify_device_class(0x0000u), category::UNKNOWN); // Misc
  EXPECT_EQ(classify_device_class(0x0300u), category::UNKNOWN); // Networking
  EXPECT_EQ(classify_device_class(0x0700u), category::UNKNOWN); // Wearable
  EXPECT_EQ(classify_device_class(0x0800u), category::UNKNOWN); // Toy
  EXPECT_EQ(classify_device_class(0x1F00u), category::UNKNOWN);
}

TEST(ClassifierTest, MissingClassIsUnknown) {
  EXPECT_EQ(classify_device_class(std::nullopt), category::UNKNOWN);
}

TEST(ClassifierTest, NeverEmpty) {
  for (uint32_t major = 0; major <= 0x1F; ++major) {
    EXPECT_FALSE(classify_device_class(major << 8).empty());
  }
}

// ============================================================================
// Address Normalization
// ============================================================================

TEST(AddressTest, UppercasesHexDigits) {
  EXPECT_EQ(normalize_address("00:11:22:33:aa:bb"), "00:11:22:33:AA:BB");
}

TEST(AddressTest, AcceptsOtherSeparators) {
  EXPECT_EQ(normalize_address("00-11-22-33-aa-bb"), "00:11:22:33:AA:BB");
  EXPECT_EQ(normalize_address("00_11_22_33_AA_BB"), "00:11:22:33:AA:BB");
}

TEST(AddressTest, TrimsWhitespace) {
  EXPECT_EQ(normalize_address("  24:6F:13:57:AB:7E\n"), "24:6F:13:57:AB:7E");
}

// ============================================================================
// DeviceRecord
// ============================================================================

TEST(DeviceRecordTest, FromRawKeepsReportedName) {
  RawDevice raw;
  raw.address = "22:33:44:cc:dd:ee";
  raw.name = "Device 2";
  raw.class_code = 0x0100u;

  auto record = DeviceRecord::from_raw(raw);
  EXPECT_EQ(record.name(), "Device 2");
  EXPECT_EQ(record.address(), "22:33:44:CC:DD:EE");
  EXPECT_EQ(record.category(), "Computer");
}

TEST(DeviceRecordTest, MissingNameFallsBackToUnknown) {
  RawDevice raw;
  raw.address = "23:45:67:89:AB:CD";

  auto record = DeviceRecord::from_raw(raw);
  EXPECT_EQ(record.name(), "UNKNOWN");
  EXPECT_EQ(record.category(), "Unknown Type");
}

TEST(DeviceRecordTest, EmptyNameFallsBackToUnknown) {
  RawDevice raw;
  raw.address = "23:45:67:89:AB:CD";
  raw.name = "";

  EXPECT_EQ(DeviceRecord::from_raw(raw).name(), DeviceRecord::UNKNOWN_NAME);
}

TEST(DeviceRecordTest, CustomFallbackName) {
  RawDevice raw;
  raw.address = "23:45:67:89:AB:CD";

  EXPECT_EQ(DeviceRecord::from_raw(raw, "(no name)").name(), "(no name)");
}

TEST(DeviceRecordTest, EqualityIsByAddress) {
  DeviceRecord a("Device 1", "00:11:22:33:AA:BB", "Phone");
  DeviceRecord b("Renamed", "00:11:22:33:AA:BB", "Computer");
  DeviceRecord c("Device 1", "22:33:44:CC:DD:EE", "Phone");

  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}
