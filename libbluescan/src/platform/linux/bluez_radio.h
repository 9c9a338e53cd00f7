/**
 * @file bluez_radio.h
 * @brief BlueZ implementation of the radio services
 *
 * Classic inquiry and low-energy scanning both map onto BlueZ discovery on
 * org.bluez.Adapter1, narrowed with SetDiscoveryFilter to the "bredr" or
 * "le" transport. Devices arrive as InterfacesAdded and PropertiesChanged
 * signals for org.bluez.Device1 on a dispatch thread owned by
 * BlueZConnection.
 */

#ifndef BLUESCAN_PLATFORM_LINUX_BLUEZ_RADIO_H
#define BLUESCAN_PLATFORM_LINUX_BLUEZ_RADIO_H

#include "bluescan/config.h"
#include "bluescan/radio.h"
#include "dbus_helpers.h"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace bluescan {
namespace platform {

// BlueZ D-Bus constants
constexpr const char *BLUEZ_SERVICE = "org.bluez";
constexpr const char *BLUEZ_ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char *BLUEZ_DEVICE_IFACE = "org.bluez.Device1";

constexpr const char *TRANSPORT_CLASSIC = "bredr";
constexpr const char *TRANSPORT_LOW_ENERGY = "le";

/**
 * @brief BlueZ adapter identity
 */
struct BlueZAdapterInfo {
  std::string object_path; // e.g., "/org/bluez/hci0"
  std::string address;     // MAC address
  std::string name;        // Adapter name
};

/**
 * @brief Find an adapter by interface name
 * @param name "hci0" style name; empty picks the first adapter
 */
Result<BlueZAdapterInfo> find_adapter(DBusConnection *conn,
                                      const std::string &name);

/// Restrict discovery to one transport ("bredr" or "le")
Result<void> set_discovery_filter(DBusConnection *conn,
                                  const std::string &adapter_path,
                                  const char *transport);

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path);

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path);

/// Address encoded in a device object path (".../dev_AA_BB_..."), or ""
std::string address_from_device_path(const std::string &path);

// ============================================================================
// Connection
// ============================================================================

/**
 * @brief System-bus access shared by the BlueZ services
 *
 * Method calls go over the shared system-bus connection. Signals are read
 * on a private connection by a dispatch thread, which keeps a cache of
 * Device1 properties per object path and fans device sightings out to
 * listeners.
 */
class BlueZConnection {
public:
  using DeviceListener = std::function<void(const RawDevice &)>;
  using PowerListener =
      std::function<void(const std::string &adapter_path, bool powered)>;

  static Result<std::shared_ptr<BlueZConnection>> open();

  ~BlueZConnection();

  BlueZConnection(const BlueZConnection &) = delete;
  BlueZConnection &operator=(const BlueZConnection &) = delete;

  /// Connection for method calls
  DBusConnection *get() const { return call_conn_.get(); }

  /// Listeners run on the dispatch thread
  uint64_t add_device_listener(DeviceListener listener);
  void remove_device_listener(uint64_t id);

  uint64_t add_power_listener(PowerListener listener);
  void remove_power_listener(uint64_t id);

private:
  BlueZConnection() = default;

  static DBusHandlerResult filter(DBusConnection *conn, DBusMessage *msg,
                                  void *user_data);

  void handle_interfaces_added(DBusMessage *msg);
  void handle_interfaces_removed(DBusMessage *msg);
  void handle_properties_changed(DBusMessage *msg);

  void emit_device(const RawDevice &device);
  void emit_power(const std::string &adapter_path, bool powered);

  void run();

  DBusConnectionWrapper call_conn_;
  DBusConnectionWrapper signal_conn_;
  std::thread dispatch_thread_;
  std::atomic<bool> stop_requested_{false};

  std::mutex mutex_;
  std::map<std::string, RawDevice> devices_; // By object path
  std::map<uint64_t, DeviceListener> device_listeners_;
  std::map<uint64_t, PowerListener> power_listeners_;
  uint64_t next_listener_id_ = 1;
};

// ============================================================================
// Adapter
// ============================================================================

class BlueZRadioAdapter : public RadioAdapter {
public:
  BlueZRadioAdapter(std::shared_ptr<BlueZConnection> conn,
                    std::string adapter_name);

  bool is_present() const override;
  bool is_enabled() const override;

private:
  std::shared_ptr<BlueZConnection> conn_;
  std::string adapter_name_;
};

// ============================================================================
// Classic Service
// ============================================================================

/**
 * @brief Inquiry over BR/EDR discovery
 *
 * BlueZ discovery runs until stopped, so an inquiry is given a fixed
 * window. When the window closes, discovery is stopped and
 * DiscoveryFinished is emitted; cancel_inquiry() closes it without one.
 */
class BlueZClassicService
    : public ClassicRadioService,
      public std::enable_shared_from_this<BlueZClassicService> {
public:
  BlueZClassicService(std::shared_ptr<BlueZConnection> conn,
                      std::string adapter_name, Milliseconds inquiry_window);
  ~BlueZClassicService() override;

  Result<SubscriptionHandle> subscribe(const std::set<ClassicEventKind> &kinds,
                                       ClassicEventHandler handler) override;
  Result<void> unsubscribe(SubscriptionHandle handle) override;

  bool start_inquiry() override;
  bool cancel_inquiry() override;

private:
  struct Subscription {
    std::set<ClassicEventKind> kinds;
    ClassicEventHandler handler;
  };

  void emit(const ClassicEvent &event);

  /// Close the window; only the first caller per inquiry gets true
  bool close_inquiry(std::string &adapter_path);

  void finish_inquiry(std::optional<Error> error);
  void run_window(uint64_t generation);
  void drop_listeners();

  std::shared_ptr<BlueZConnection> conn_;
  std::string adapter_name_;
  Milliseconds inquiry_window_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::map<SubscriptionHandle, Subscription> subscriptions_;
  SubscriptionHandle next_handle_ = 1;

  bool inquiring_ = false;
  uint64_t generation_ = 0;
  std::string adapter_path_;
  uint64_t device_listener_ = 0;
  uint64_t power_listener_ = 0;
  std::thread window_thread_;
};

// ============================================================================
// Low Energy Service
// ============================================================================

class BlueZLowEnergyService
    : public LowEnergyRadioService,
      public std::enable_shared_from_this<BlueZLowEnergyService> {
public:
  BlueZLowEnergyService(std::shared_ptr<BlueZConnection> conn,
                        std::string adapter_name);
  ~BlueZLowEnergyService() override;

  Result<SubscriptionHandle> start_scan(LowEnergyResultHandler on_result,
                                        LowEnergyFailureHandler on_failed)
      override;
  Result<void> stop_scan(SubscriptionHandle handle) override;

private:
  void drop_listeners();

  std::shared_ptr<BlueZConnection> conn_;
  std::string adapter_name_;

  std::mutex mutex_;
  SubscriptionHandle active_ = 0;
  SubscriptionHandle next_handle_ = 1;
  std::string adapter_path_;
  LowEnergyResultHandler on_result_;
  LowEnergyFailureHandler on_failed_;
  uint64_t device_listener_ = 0;
  uint64_t power_listener_ = 0;
};

// ============================================================================
// Factory
// ============================================================================

/**
 * @brief Connect to BlueZ and build the full radio platform
 *
 * Grants come from the configuration: on desktop Linux access to the
 * adapter is decided by D-Bus policy, not a runtime dialog.
 */
Result<RadioPlatform> make_bluez_platform(const ScanConfig &config);

} // namespace platform
} // namespace bluescan

#endif // BLUESCAN_PLATFORM_LINUX_BLUEZ_RADIO_H
