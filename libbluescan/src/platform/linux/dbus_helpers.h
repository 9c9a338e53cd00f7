/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for the Linux radio backend
 */

#ifndef BLUESCAN_PLATFORM_LINUX_DBUS_HELPERS_H
#define BLUESCAN_PLATFORM_LINUX_DBUS_HELPERS_H

#include "bluescan/error.h"
#include <dbus/dbus.h>
#include <optional>
#include <string>

namespace bluescan {
namespace platform {

constexpr const char *DBUS_PROPERTIES_IFACE = "org.freedesktop.DBus.Properties";
constexpr const char *DBUS_OBJECT_MANAGER_IFACE =
    "org.freedesktop.DBus.ObjectManager";

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief Owning handle for a DBusConnection
 *
 * Private connections are closed before the last unref, as libdbus
 * requires.
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  DBusConnectionWrapper(DBusConnection *conn, bool is_private)
      : conn_(conn), private_(is_private) {}

  ~DBusConnectionWrapper() { reset(); }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_), private_(other.private_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      reset();
      conn_ = other.conn_;
      private_ = other.private_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  DBusConnection *get() const { return conn_; }
  explicit operator bool() const { return conn_ != nullptr; }

  void reset() {
    if (conn_) {
      if (private_) {
        dbus_connection_close(conn_);
      }
      dbus_connection_unref(conn_);
      conn_ = nullptr;
    }
  }

private:
  DBusConnection *conn_ = nullptr;
  bool private_ = false;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  explicit operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helper
// ============================================================================

/**
 * @brief Convert a DBusError to a BlueScan Error
 *
 * Access-denied replies become PermissionDenied; everything else is a
 * PlatformError carrying the D-Bus error name.
 */
inline Error dbus_error_to_bluescan(const DBusError &err) {
  if (!dbus_error_is_set(&err)) {
    return Error(ErrorCode::PlatformError, "D-Bus call failed");
  }

  std::string name = err.name ? err.name : "";
  std::string message = err.message ? err.message : "D-Bus error";

  if (name == DBUS_ERROR_ACCESS_DENIED ||
      name == "org.bluez.Error.NotAuthorized") {
    return Error(ErrorCode::PermissionDenied, message, name);
  }
  if (name == DBUS_ERROR_SERVICE_UNKNOWN ||
      name == DBUS_ERROR_NAME_HAS_NO_OWNER) {
    return Error(ErrorCode::ServiceUnavailable, message, name);
  }
  return Error(ErrorCode::PlatformError, message, name);
}

class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusErrorWrapper(const DBusErrorWrapper &) = delete;
  DBusErrorWrapper &operator=(const DBusErrorWrapper &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error() const { return dbus_error_to_bluescan(err_); }

  const char *name() const { return err_.name; }

private:
  DBusError err_;
};

// ============================================================================
// D-Bus Helper Functions
// ============================================================================

/**
 * @brief Connect to the system bus
 * @param private_connection Open a connection of our own instead of the
 *        process-wide shared one (needed for a dispatch thread)
 */
inline Result<DBusConnectionWrapper>
get_system_bus(bool private_connection = false) {
  DBusErrorWrapper error;
  DBusConnection *conn = private_connection
                             ? dbus_bus_get_private(DBUS_BUS_SYSTEM, error.get())
                             : dbus_bus_get(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    Error err = error.to_error();
    err.code = ErrorCode::ServiceUnavailable;
    return err;
  }

  // Closing the process on disconnect is libdbus's default; never wanted
  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn, private_connection);
}

/**
 * @brief Send a prepared method call and wait for the reply
 */
inline Result<DBusMessageWrapper> send_and_wait(DBusConnection *conn,
                                                DBusMessage *msg,
                                                int timeout_ms = -1) {
  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn, msg, timeout_ms, error.get());

  if (!reply || error.is_set()) {
    if (reply) {
      dbus_message_unref(reply);
    }
    return error.to_error();
  }

  return DBusMessageWrapper(reply);
}

/**
 * @brief Call a method without arguments and get the reply
 */
inline Result<DBusMessageWrapper>
call_method(DBusConnection *conn, const char *dest, const char *path,
            const char *iface, const char *method, int timeout_ms = -1) {
  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, iface, method));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  return send_and_wait(conn, msg.get(), timeout_ms);
}

/**
 * @brief Call Properties.Get; the reply body is a single variant
 */
inline Result<DBusMessageWrapper>
get_property(DBusConnection *conn, const char *dest, const char *path,
             const char *iface, const char *property) {
  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, DBUS_PROPERTIES_IFACE, "Get"));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &iface,
                           DBUS_TYPE_STRING, &property, DBUS_TYPE_INVALID);

  return send_and_wait(conn, msg.get());
}

/**
 * @brief Get a string property from a D-Bus object
 */
inline Result<std::string>
get_string_property(DBusConnection *conn, const char *dest, const char *path,
                    const char *iface, const char *property) {
  auto reply = get_property(conn, dest, path, iface, property);
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter, variant_iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
    return Error(ErrorCode::PlatformError, "Expected variant type");
  }

  dbus_message_iter_recurse(&iter, &variant_iter);
  int type = dbus_message_iter_get_arg_type(&variant_iter);
  if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) {
    return Error(ErrorCode::PlatformError, "Expected string in variant");
  }

  const char *value = nullptr;
  dbus_message_iter_get_basic(&variant_iter, &value);

  return std::string(value ? value : "");
}

/**
 * @brief Get a boolean property from a D-Bus object
 */
inline Result<bool> get_bool_property(DBusConnection *conn, const char *dest,
                                      const char *path, const char *iface,
                                      const char *property) {
  auto reply = get_property(conn, dest, path, iface, property);
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter, variant_iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter) ||
      dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
    return Error(ErrorCode::PlatformError, "Expected variant type");
  }

  dbus_message_iter_recurse(&iter, &variant_iter);
  if (dbus_message_iter_get_arg_type(&variant_iter) != DBUS_TYPE_BOOLEAN) {
    return Error(ErrorCode::PlatformError, "Expected boolean in variant");
  }

  dbus_bool_t value = FALSE;
  dbus_message_iter_get_basic(&variant_iter, &value);
  return value == TRUE;
}

// ============================================================================
// Variant Readers
// ============================================================================
//
// Each reader takes an iterator positioned on a variant (as found in a{sv}
// dictionaries) and returns nullopt if the contained type does not match.

inline std::optional<std::string> read_variant_string(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_VARIANT) {
    return std::nullopt;
  }
  DBusMessageIter inner;
  dbus_message_iter_recurse(iter, &inner);
  if (dbus_message_iter_get_arg_type(&inner) != DBUS_TYPE_STRING) {
    return std::nullopt;
  }
  const char *value = nullptr;
  dbus_message_iter_get_basic(&inner, &value);
  return std::string(value ? value : "");
}

inline std::optional<bool> read_variant_bool(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_VARIANT) {
    return std::nullopt;
  }
  DBusMessageIter inner;
  dbus_message_iter_recurse(iter, &inner);
  if (dbus_message_iter_get_arg_type(&inner) != DBUS_TYPE_BOOLEAN) {
    return std::nullopt;
  }
  dbus_bool_t value = FALSE;
  dbus_message_iter_get_basic(&inner, &value);
  return value == TRUE;
}

inline std::optional<uint32_t> read_variant_uint32(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_VARIANT) {
    return std::nullopt;
  }
  DBusMessageIter inner;
  dbus_message_iter_recurse(iter, &inner);
  if (dbus_message_iter_get_arg_type(&inner) != DBUS_TYPE_UINT32) {
    return std::nullopt;
  }
  dbus_uint32_t value = 0;
  dbus_message_iter_get_basic(&inner, &value);
  return static_cast<uint32_t>(value);
}

inline std::optional<int> read_variant_int16(DBusMessageIter *iter) {
  if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_VARIANT) {
    return std::nullopt;
  }
  DBusMessageIter inner;
  dbus_message_iter_recurse(iter, &inner);
  if (dbus_message_iter_get_arg_type(&inner) != DBUS_TYPE_INT16) {
    return std::nullopt;
  }
  dbus_int16_t value = 0;
  dbus_message_iter_get_basic(&inner, &value);
  return static_cast<int>(value);
}

// ============================================================================
// Signals
// ============================================================================

/**
 * @brief Subscribe the connection to signals matching @p rule
 */
inline Result<void> add_match(DBusConnection *conn, const std::string &rule) {
  DBusErrorWrapper error;
  dbus_bus_add_match(conn, rule.c_str(), error.get());
  if (error.is_set()) {
    return error.to_error();
  }
  return Result<void>::ok();
}

} // namespace platform
} // namespace bluescan

#endif // BLUESCAN_PLATFORM_LINUX_DBUS_HELPERS_H
