/**
 * @file config.h
 * @brief Scan configuration and its persistence
 */

#ifndef BLUESCAN_CONFIG_H
#define BLUESCAN_CONFIG_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace bluescan {

// ============================================================================
// Scan Configuration
// ============================================================================

/**
 * @brief Everything tunable about a scan
 */
struct BLUESCAN_API ScanConfig {
  // ========================================================================
  // Timing
  // ========================================================================

  /// How long a low-energy scan runs before stopping itself
  Milliseconds low_energy_timeout{12000};

  /// Length of one classic inquiry window
  Milliseconds classic_inquiry_duration{12000};

  // ========================================================================
  // Permissions
  // ========================================================================

  /// Platform version fed to the permission gate
  int platform_version = 31;

  /// Grants held on platforms without a runtime grant dialog
  CapabilitySet granted_capabilities = {
      Capability::Radio, Capability::RadioAdmin, Capability::RadioScan,
      Capability::CoarseLocation, Capability::FineLocation};

  // ========================================================================
  // Radio
  // ========================================================================

  /// Adapter name ("hci0"); empty selects the first adapter found
  std::string adapter;

  /// Display name for devices that report none
  std::string unknown_device_name = "UNKNOWN";

  /// Mode the front-end starts in
  ScanMode default_mode = ScanMode::Classic;

  // ========================================================================
  // Methods
  // ========================================================================

  void load_defaults();

  Result<void> validate() const;

  /// $XDG_CONFIG_HOME/bluescan, falling back to ~/.config/bluescan
  static std::filesystem::path get_default_config_dir();
};

/// "classic" / "low_energy", as written in the config file
BLUESCAN_API const char *scan_mode_config_name(ScanMode mode);
BLUESCAN_API std::optional<ScanMode>
scan_mode_from_config_name(const std::string &name);

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Loads, saves and validates a ScanConfig
 *
 * The file is a JSON object, one member per setting:
 * @code
 *   {
 *     "low_energy_timeout_ms": 12000,
 *     "classic_inquiry_duration_ms": 12000,
 *     "platform_version": 31,
 *     "granted_capabilities": ["RADIO", "RADIO_ADMIN", "RADIO_SCAN"],
 *     "adapter": "hci0",
 *     "unknown_device_name": "UNKNOWN",
 *     "default_mode": "classic"
 *   }
 * @endcode
 * Keys left out keep their defaults.
 */
class BLUESCAN_API ConfigManager {
public:
  static constexpr const char *FILE_NAME = "bluescan.json";

  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Set the config file path and load it if it exists
   * @param config_path File to use; empty selects the default location
   * @return Error from loading an existing file. Defaults stay in effect
   *         and the manager is usable either way.
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  const std::filesystem::path &config_path() const;

  // ========================================================================
  // Configuration Access
  // ========================================================================

  /// Copy of the current configuration
  ScanConfig get() const;

  /// Replace the configuration after validating it
  Result<void> set(const ScanConfig &config);

  // ========================================================================
  // Persistence
  // ========================================================================

  /**
   * @brief Read the config file
   *
   * On a parse or validation error the current configuration is left
   * unchanged.
   */
  Result<void> load();

  /// Write the current configuration, creating the directory if needed
  Result<void> save();

  void reset_defaults();

  // ========================================================================
  // JSON Format
  // ========================================================================

  /// Parse file contents on top of the defaults
  static Result<ScanConfig> parse(const std::string &text);

  static std::string serialize(const ScanConfig &config);

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace bluescan

#endif // BLUESCAN_CONFIG_H
