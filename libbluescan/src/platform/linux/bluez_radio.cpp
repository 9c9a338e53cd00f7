/**
 * @file bluez_radio.cpp
 * @brief BlueZ radio services over D-Bus
 */

#include "bluez_radio.h"
#include "bluescan/permission.h"
#include <cstring>
#include <utility>
#include <vector>

namespace bluescan {
namespace platform {

namespace {

constexpr int DISPATCH_TIMEOUT_MS = 100;

const char *const SIGNAL_MATCH_RULES[] = {
    "type='signal',sender='org.bluez',"
    "interface='org.freedesktop.DBus.ObjectManager',member='InterfacesAdded'",
    "type='signal',sender='org.bluez',"
    "interface='org.freedesktop.DBus.ObjectManager',"
    "member='InterfacesRemoved'",
    "type='signal',sender='org.bluez',"
    "interface='org.freedesktop.DBus.Properties',member='PropertiesChanged'"};

/// What a Device1 property dictionary told us
struct DeviceUpdate {
  bool seen = false; // RSSI present: the radio just heard the device
};

/// Merge an a{sv} Device1 dictionary into @p device
DeviceUpdate merge_device_properties(DBusMessageIter *array_iter,
                                     RawDevice &device) {
  DeviceUpdate update;
  if (dbus_message_iter_get_arg_type(array_iter) != DBUS_TYPE_ARRAY) {
    return update;
  }

  DBusMessageIter dict;
  dbus_message_iter_recurse(array_iter, &dict);

  while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry;
    dbus_message_iter_recurse(&dict, &entry);

    const char *key = nullptr;
    dbus_message_iter_get_basic(&entry, &key);
    dbus_message_iter_next(&entry);

    if (key) {
      if (std::strcmp(key, "Address") == 0) {
        if (auto v = read_variant_string(&entry)) {
          device.address = *v;
        }
      } else if (std::strcmp(key, "Name") == 0) {
        if (auto v = read_variant_string(&entry)) {
          device.name = *v;
        }
      } else if (std::strcmp(key, "Class") == 0) {
        if (auto v = read_variant_uint32(&entry)) {
          device.class_code = *v;
        }
      } else if (std::strcmp(key, "RSSI") == 0) {
        if (auto v = read_variant_int16(&entry)) {
          device.rssi_dbm = *v;
          update.seen = true;
        }
      }
    }

    dbus_message_iter_next(&dict);
  }

  return update;
}

bool error_mentions(const Error &error, const char *word) {
  return error.message.find(word) != std::string::npos ||
         error.details.find(word) != std::string::npos;
}

} // namespace

// ============================================================================
// BlueZ Adapter Discovery
// ============================================================================

Result<BlueZAdapterInfo> find_adapter(DBusConnection *conn,
                                      const std::string &name) {
  auto reply = call_method(conn, BLUEZ_SERVICE, "/", DBUS_OBJECT_MANAGER_IFACE,
                           "GetManagedObjects");
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter, dict_iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter)) {
    return Error(ErrorCode::PlatformError, "Empty reply from BlueZ");
  }

  if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
    return Error(ErrorCode::PlatformError, "Unexpected reply format");
  }

  dbus_message_iter_recurse(&iter, &dict_iter);

  while (dbus_message_iter_get_arg_type(&dict_iter) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry_iter, iface_dict_iter;
    dbus_message_iter_recurse(&dict_iter, &entry_iter);

    const char *path = nullptr;
    dbus_message_iter_get_basic(&entry_iter, &path);
    dbus_message_iter_next(&entry_iter);

    std::string object_path = path ? path : "";
    bool name_matches =
        name.empty() ||
        (object_path.size() > name.size() &&
         object_path.compare(object_path.size() - name.size(), name.size(),
                             name) == 0 &&
         object_path[object_path.size() - name.size() - 1] == '/');

    if (!object_path.empty() && name_matches &&
        dbus_message_iter_get_arg_type(&entry_iter) == DBUS_TYPE_ARRAY) {
      dbus_message_iter_recurse(&entry_iter, &iface_dict_iter);

      while (dbus_message_iter_get_arg_type(&iface_dict_iter) ==
             DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter iface_entry;
        dbus_message_iter_recurse(&iface_dict_iter, &iface_entry);

        const char *iface = nullptr;
        dbus_message_iter_get_basic(&iface_entry, &iface);

        if (iface && std::strcmp(iface, BLUEZ_ADAPTER_IFACE) == 0) {
          BlueZAdapterInfo adapter;
          adapter.object_path = object_path;

          auto addr = get_string_property(conn, BLUEZ_SERVICE, path,
                                          BLUEZ_ADAPTER_IFACE, "Address");
          if (addr.is_ok()) {
            adapter.address = addr.value();
          }

          auto alias = get_string_property(conn, BLUEZ_SERVICE, path,
                                           BLUEZ_ADAPTER_IFACE, "Name");
          if (alias.is_ok()) {
            adapter.name = alias.value();
          }

          return adapter;
        }

        dbus_message_iter_next(&iface_dict_iter);
      }
    }

    dbus_message_iter_next(&dict_iter);
  }

  return Error(ErrorCode::RadioUnavailable, "No Bluetooth adapter found",
               name);
}

// ============================================================================
// Discovery Control
// ============================================================================

Result<void> set_discovery_filter(DBusConnection *conn,
                                  const std::string &adapter_path,
                                  const char *transport) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      BLUEZ_SERVICE, adapter_path.c_str(), BLUEZ_ADAPTER_IFACE,
      "SetDiscoveryFilter"));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  // a{sv} { "Transport": <transport> }
  DBusMessageIter iter, dict, entry, variant;
  const char *key = "Transport";
  dbus_message_iter_init_append(msg.get(), &iter);
  dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
  dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr,
                                   &entry);
  dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
  dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
  dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &transport);
  dbus_message_iter_close_container(&entry, &variant);
  dbus_message_iter_close_container(&dict, &entry);
  dbus_message_iter_close_container(&iter, &dict);

  auto reply = send_and_wait(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StartDiscovery");

  if (result.is_error()) {
    // Already discovering is not an error
    if (error_mentions(result.error(), "InProgress")) {
      return Result<void>::ok();
    }
    return result.error();
  }

  return Result<void>::ok();
}

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StopDiscovery");

  if (result.is_error()) {
    // Not discovering is not an error
    if (error_mentions(result.error(), "No discovery started") ||
        error_mentions(result.error(), "NotReady")) {
      return Result<void>::ok();
    }
    return result.error();
  }

  return Result<void>::ok();
}

std::string address_from_device_path(const std::string &path) {
  auto pos = path.rfind("/dev_");
  if (pos == std::string::npos) {
    return "";
  }
  return path.substr(pos + 5);
}

// ============================================================================
// BlueZConnection
// ============================================================================

Result<std::shared_ptr<BlueZConnection>> BlueZConnection::open() {
  // Method calls and the dispatch thread share libdbus state
  if (!dbus_threads_init_default()) {
    return Error(ErrorCode::PlatformError, "Failed to initialize D-Bus threads");
  }

  std::shared_ptr<BlueZConnection> self(new BlueZConnection());

  auto calls = get_system_bus(false);
  if (calls.is_error()) {
    return calls.error();
  }
  self->call_conn_ = std::move(calls.value());

  auto signals = get_system_bus(true);
  if (signals.is_error()) {
    return signals.error();
  }
  self->signal_conn_ = std::move(signals.value());

  for (const char *rule : SIGNAL_MATCH_RULES) {
    BLUESCAN_TRY(add_match(self->signal_conn_.get(), rule));
  }

  if (!dbus_connection_add_filter(self->signal_conn_.get(),
                                  &BlueZConnection::filter, self.get(),
                                  nullptr)) {
    return Error(ErrorCode::PlatformError, "Failed to add D-Bus filter");
  }

  BlueZConnection *raw = self.get();
  self->dispatch_thread_ = std::thread([raw] { raw->run(); });
  return self;
}

BlueZConnection::~BlueZConnection() {
  stop_requested_ = true;
  if (dispatch_thread_.joinable()) {
    dispatch_thread_.join();
  }
  if (signal_conn_) {
    dbus_connection_remove_filter(signal_conn_.get(), &BlueZConnection::filter,
                                  this);
  }
}

void BlueZConnection::run() {
  while (!stop_requested_) {
    // FALSE once the bus connection is gone
    if (!dbus_connection_read_write_dispatch(signal_conn_.get(),
                                             DISPATCH_TIMEOUT_MS)) {
      break;
    }
  }
}

DBusHandlerResult BlueZConnection::filter(DBusConnection *conn,
                                          DBusMessage *msg, void *user_data) {
  BLUESCAN_UNUSED(conn);
  auto *self = static_cast<BlueZConnection *>(user_data);

  if (dbus_message_is_signal(msg, DBUS_OBJECT_MANAGER_IFACE,
                             "InterfacesAdded")) {
    self->handle_interfaces_added(msg);
  } else if (dbus_message_is_signal(msg, DBUS_OBJECT_MANAGER_IFACE,
                                    "InterfacesRemoved")) {
    self->handle_interfaces_removed(msg);
  } else if (dbus_message_is_signal(msg, DBUS_PROPERTIES_IFACE,
                                    "PropertiesChanged")) {
    self->handle_properties_changed(msg);
  }

  return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

void BlueZConnection::handle_interfaces_added(DBusMessage *msg) {
  // oa{sa{sv}}
  DBusMessageIter iter, ifaces;
  if (!dbus_message_iter_init(msg, &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_OBJECT_PATH) {
    return;
  }

  const char *path = nullptr;
  dbus_message_iter_get_basic(&iter, &path);
  dbus_message_iter_next(&iter);
  if (!path || dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
    return;
  }

  dbus_message_iter_recurse(&iter, &ifaces);
  while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry;
    dbus_message_iter_recurse(&ifaces, &entry);

    const char *iface = nullptr;
    dbus_message_iter_get_basic(&entry, &iface);
    dbus_message_iter_next(&entry);

    if (iface && std::strcmp(iface, BLUEZ_DEVICE_IFACE) == 0) {
      RawDevice device;
      device.address = address_from_device_path(path);
      merge_device_properties(&entry, device);

      {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[path] = device;
      }
      // A new object during discovery is a sighting
      emit_device(device);
    }

    dbus_message_iter_next(&ifaces);
  }
}

void BlueZConnection::handle_interfaces_removed(DBusMessage *msg) {
  DBusMessageIter iter;
  if (!dbus_message_iter_init(msg, &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_OBJECT_PATH) {
    return;
  }

  const char *path = nullptr;
  dbus_message_iter_get_basic(&iter, &path);
  if (!path) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  devices_.erase(path);
}

void BlueZConnection::handle_properties_changed(DBusMessage *msg) {
  // sa{sv}as, sent from the object whose properties changed
  const char *path = dbus_message_get_path(msg);
  DBusMessageIter iter;
  if (!path || !dbus_message_iter_init(msg, &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) {
    return;
  }

  const char *iface = nullptr;
  dbus_message_iter_get_basic(&iter, &iface);
  dbus_message_iter_next(&iter);
  if (!iface) {
    return;
  }

  if (std::strcmp(iface, BLUEZ_DEVICE_IFACE) == 0) {
    RawDevice device;
    DeviceUpdate update;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = devices_.find(path);
      if (it == devices_.end()) {
        it = devices_.emplace(path, RawDevice{}).first;
        it->second.address = address_from_device_path(path);
      }
      update = merge_device_properties(&iter, it->second);
      device = it->second;
    }
    if (update.seen) {
      emit_device(device);
    }
    return;
  }

  if (std::strcmp(iface, BLUEZ_ADAPTER_IFACE) == 0 &&
      dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
    DBusMessageIter dict;
    dbus_message_iter_recurse(&iter, &dict);
    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
      DBusMessageIter entry;
      dbus_message_iter_recurse(&dict, &entry);
      const char *key = nullptr;
      dbus_message_iter_get_basic(&entry, &key);
      dbus_message_iter_next(&entry);
      if (key && std::strcmp(key, "Powered") == 0) {
        if (auto powered = read_variant_bool(&entry)) {
          emit_power(path, *powered);
        }
      }
      dbus_message_iter_next(&dict);
    }
  }
}

void BlueZConnection::emit_device(const RawDevice &device) {
  std::vector<DeviceListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : device_listeners_) {
      listeners.push_back(entry.second);
    }
  }
  for (const auto &listener : listeners) {
    listener(device);
  }
}

void BlueZConnection::emit_power(const std::string &adapter_path,
                                 bool powered) {
  std::vector<PowerListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : power_listeners_) {
      listeners.push_back(entry.second);
    }
  }
  for (const auto &listener : listeners) {
    listener(adapter_path, powered);
  }
}

uint64_t BlueZConnection::add_device_listener(DeviceListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t id = next_listener_id_++;
  device_listeners_.emplace(id, std::move(listener));
  return id;
}

void BlueZConnection::remove_device_listener(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  device_listeners_.erase(id);
}

uint64_t BlueZConnection::add_power_listener(PowerListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t id = next_listener_id_++;
  power_listeners_.emplace(id, std::move(listener));
  return id;
}

void BlueZConnection::remove_power_listener(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  power_listeners_.erase(id);
}

// ============================================================================
// BlueZRadioAdapter
// ============================================================================

BlueZRadioAdapter::BlueZRadioAdapter(std::shared_ptr<BlueZConnection> conn,
                                     std::string adapter_name)
    : conn_(std::move(conn)), adapter_name_(std::move(adapter_name)) {}

bool BlueZRadioAdapter::is_present() const {
  return find_adapter(conn_->get(), adapter_name_).is_ok();
}

bool BlueZRadioAdapter::is_enabled() const {
  auto adapter = find_adapter(conn_->get(), adapter_name_);
  if (adapter.is_error()) {
    return false;
  }
  auto powered =
      get_bool_property(conn_->get(), BLUEZ_SERVICE,
                        adapter.value().object_path.c_str(),
                        BLUEZ_ADAPTER_IFACE, "Powered");
  return powered.is_ok() && powered.value();
}

// ============================================================================
// BlueZClassicService
// ============================================================================

BlueZClassicService::BlueZClassicService(std::shared_ptr<BlueZConnection> conn,
                                         std::string adapter_name,
                                         Milliseconds inquiry_window)
    : conn_(std::move(conn)), adapter_name_(std::move(adapter_name)),
      inquiry_window_(inquiry_window) {}

BlueZClassicService::~BlueZClassicService() {
  std::string path;
  bool was_inquiring = close_inquiry(path);
  drop_listeners();

  std::thread window;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    window = std::move(window_thread_);
  }
  if (window.joinable()) {
    window.join();
  }

  if (was_inquiring) {
    // Nobody is left to report a failure to
    stop_discovery(conn_->get(), path);
  }
}

Result<SubscriptionHandle>
BlueZClassicService::subscribe(const std::set<ClassicEventKind> &kinds,
                               ClassicEventHandler handler) {
  if (!handler) {
    return Error(ErrorCode::InvalidArgument, "Handler is empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionHandle handle = next_handle_++;
  subscriptions_.emplace(handle, Subscription{kinds, std::move(handler)});
  return handle;
}

Result<void> BlueZClassicService::unsubscribe(SubscriptionHandle handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (subscriptions_.erase(handle) == 0) {
    return Error(ErrorCode::NotFound, "Unknown subscription",
                 std::to_string(handle));
  }
  return Result<void>::ok();
}

void BlueZClassicService::emit(const ClassicEvent &event) {
  std::vector<ClassicEventHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : subscriptions_) {
      if (entry.second.kinds.count(event.kind) > 0) {
        handlers.push_back(entry.second.handler);
      }
    }
  }
  for (const auto &handler : handlers) {
    handler(event);
  }
}

bool BlueZClassicService::start_inquiry() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (inquiring_) {
      return false;
    }
  }

  auto adapter = find_adapter(conn_->get(), adapter_name_);
  if (adapter.is_error()) {
    return false;
  }
  const std::string path = adapter.value().object_path;

  if (set_discovery_filter(conn_->get(), path, TRANSPORT_CLASSIC).is_error()) {
    return false;
  }

  std::weak_ptr<BlueZClassicService> weak = weak_from_this();
  uint64_t device_listener =
      conn_->add_device_listener([weak](const RawDevice &device) {
        if (auto self = weak.lock()) {
          ClassicEvent event;
          event.kind = ClassicEventKind::DeviceFound;
          event.device = device;
          self->emit(event);
        }
      });
  uint64_t power_listener = conn_->add_power_listener(
      [weak, path](const std::string &adapter_path, bool powered) {
        auto self = weak.lock();
        if (self && !powered && adapter_path == path) {
          self->finish_inquiry(
              Error(ErrorCode::RadioDisabled, "Adapter powered off"));
        }
      });

  std::thread previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    inquiring_ = true;
    ++generation_;
    adapter_path_ = path;
    device_listener_ = device_listener;
    power_listener_ = power_listener;
    previous = std::move(window_thread_);
  }
  if (previous.joinable()) {
    previous.join();
  }

  if (start_discovery(conn_->get(), path).is_error()) {
    std::string unused;
    close_inquiry(unused);
    drop_listeners();
    return false;
  }

  ClassicEvent started;
  started.kind = ClassicEventKind::DiscoveryStarted;
  emit(started);

  std::lock_guard<std::mutex> lock(mutex_);
  if (inquiring_) {
    uint64_t generation = generation_;
    window_thread_ = std::thread([this, generation] { run_window(generation); });
  }
  return true;
}

bool BlueZClassicService::cancel_inquiry() {
  std::string path;
  if (!close_inquiry(path)) {
    // Nothing running: the window already closed
    return true;
  }
  drop_listeners();

  std::thread window;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    window = std::move(window_thread_);
  }
  if (window.joinable()) {
    window.join();
  }

  return stop_discovery(conn_->get(), path).is_ok();
}

bool BlueZClassicService::close_inquiry(std::string &adapter_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!inquiring_) {
    return false;
  }
  inquiring_ = false;
  adapter_path = adapter_path_;
  cv_.notify_all();
  return true;
}

void BlueZClassicService::finish_inquiry(std::optional<Error> error) {
  std::string path;
  if (!close_inquiry(path)) {
    return;
  }
  drop_listeners();

  auto stopped = stop_discovery(conn_->get(), path);
  if (!error && stopped.is_error()) {
    error = stopped.error();
  }

  ClassicEvent finished;
  finished.kind = ClassicEventKind::DiscoveryFinished;
  finished.error = std::move(error);
  emit(finished);
}

void BlueZClassicService::run_window(uint64_t generation) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    bool closed = cv_.wait_for(lock, inquiry_window_, [this, generation] {
      return !inquiring_ || generation_ != generation;
    });
    if (closed) {
      return;
    }
  }
  finish_inquiry(std::nullopt);
}

void BlueZClassicService::drop_listeners() {
  uint64_t device_listener = 0;
  uint64_t power_listener = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::swap(device_listener, device_listener_);
    std::swap(power_listener, power_listener_);
  }
  if (device_listener != 0) {
    conn_->remove_device_listener(device_listener);
  }
  if (power_listener != 0) {
    conn_->remove_power_listener(power_listener);
  }
}

// ============================================================================
// BlueZLowEnergyService
// ============================================================================

BlueZLowEnergyService::BlueZLowEnergyService(
    std::shared_ptr<BlueZConnection> conn, std::string adapter_name)
    : conn_(std::move(conn)), adapter_name_(std::move(adapter_name)) {}

BlueZLowEnergyService::~BlueZLowEnergyService() {
  drop_listeners();

  std::string path;
  bool was_active = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_active = active_ != 0;
    path = adapter_path_;
    active_ = 0;
  }
  if (was_active) {
    // Nobody is left to report a failure to
    stop_discovery(conn_->get(), path);
  }
}

Result<SubscriptionHandle>
BlueZLowEnergyService::start_scan(LowEnergyResultHandler on_result,
                                  LowEnergyFailureHandler on_failed) {
  SubscriptionHandle handle = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ != 0) {
      return Error(ErrorCode::PlatformError,
                   "A low-energy scan is already running");
    }
    handle = next_handle_++;
    active_ = handle;
    on_result_ = std::move(on_result);
    on_failed_ = std::move(on_failed);
  }

  auto fail = [this](Error error) -> Result<SubscriptionHandle> {
    drop_listeners();
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = 0;
    on_result_ = nullptr;
    on_failed_ = nullptr;
    return error;
  };

  auto adapter = find_adapter(conn_->get(), adapter_name_);
  if (adapter.is_error()) {
    return fail(adapter.error());
  }
  const std::string path = adapter.value().object_path;

  auto filtered = set_discovery_filter(conn_->get(), path,
                                       TRANSPORT_LOW_ENERGY);
  if (filtered.is_error()) {
    return fail(filtered.error());
  }

  std::weak_ptr<BlueZLowEnergyService> weak = weak_from_this();
  uint64_t device_listener =
      conn_->add_device_listener([weak, handle](const RawDevice &device) {
        auto self = weak.lock();
        if (!self) {
          return;
        }
        LowEnergyResultHandler cb;
        {
          std::lock_guard<std::mutex> lock(self->mutex_);
          if (self->active_ != handle) {
            return;
          }
          cb = self->on_result_;
        }
        if (cb) {
          LowEnergyScanResult result;
          result.device = device;
          cb(result);
        }
      });
  uint64_t power_listener = conn_->add_power_listener(
      [weak, handle, path](const std::string &adapter_path, bool powered) {
        auto self = weak.lock();
        if (!self || powered || adapter_path != path) {
          return;
        }
        LowEnergyFailureHandler cb;
        {
          std::lock_guard<std::mutex> lock(self->mutex_);
          if (self->active_ != handle) {
            return;
          }
          cb = self->on_failed_;
        }
        if (cb) {
          cb(Error(ErrorCode::RadioDisabled, "Adapter powered off"));
        }
      });

  {
    std::lock_guard<std::mutex> lock(mutex_);
    adapter_path_ = path;
    device_listener_ = device_listener;
    power_listener_ = power_listener;
  }

  auto started = start_discovery(conn_->get(), path);
  if (started.is_error()) {
    return fail(started.error());
  }

  return handle;
}

Result<void> BlueZLowEnergyService::stop_scan(SubscriptionHandle handle) {
  std::string path;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle == 0 || active_ != handle) {
      return Error(ErrorCode::NotFound, "Unknown low-energy scan",
                   std::to_string(handle));
    }
    active_ = 0;
    on_result_ = nullptr;
    on_failed_ = nullptr;
    path = adapter_path_;
  }
  drop_listeners();

  return stop_discovery(conn_->get(), path);
}

void BlueZLowEnergyService::drop_listeners() {
  uint64_t device_listener = 0;
  uint64_t power_listener = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::swap(device_listener, device_listener_);
    std::swap(power_listener, power_listener_);
  }
  if (device_listener != 0) {
    conn_->remove_device_listener(device_listener);
  }
  if (power_listener != 0) {
    conn_->remove_power_listener(power_listener);
  }
}

// ============================================================================
// Factory
// ============================================================================

Result<RadioPlatform> make_bluez_platform(const ScanConfig &config) {
  auto conn = BlueZConnection::open();
  if (conn.is_error()) {
    return conn.error();
  }

  RadioPlatform radio;
  radio.adapter =
      std::make_shared<BlueZRadioAdapter>(conn.value(), config.adapter);
  radio.classic = std::make_shared<BlueZClassicService>(
      conn.value(), config.adapter, config.classic_inquiry_duration);
  radio.low_energy =
      std::make_shared<BlueZLowEnergyService>(conn.value(), config.adapter);
  radio.permissions = std::make_shared<StaticPermissionSource>(
      config.platform_version, config.granted_capabilities);
  return radio;
}

} // namespace platform
} // namespace bluescan
