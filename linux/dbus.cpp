#include "dbus.hpp"
#include <log.hpp>
#include <types/error.hpp>
#include <cstring>

using aranet::Error;
using aranet::ErrorKind;

namespace dbus_client {

Connection::Connection(Connection&& other) noexcept
    : conn_(other.conn_) {
    other.conn_ = nullptr;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

Connection::~Connection() {
    close();
}

void Connection::close() {
    if (conn_) {
        dbus_connection_close(conn_);
        dbus_connection_unref(conn_);
        conn_ = nullptr;
    }
}

Connection open_system_bus() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get_private(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::string message = std::string("failed to connect to system D-Bus: ") + err.message;
        dbus_error_free(&err);
        throw Error(ErrorKind::TransportError, message);
    }
    if (!conn) {
        throw Error(ErrorKind::TransportError, "failed to connect to system D-Bus");
    }

    dbus_connection_set_exit_on_disconnect(conn, FALSE);
    return Connection(conn);
}

Message new_method_call(const char* dest, const char* path, const char* iface, const char* method) {
    DBusMessage* msg = dbus_message_new_method_call(dest, path, iface, method);
    if (!msg) {
        throw Error(ErrorKind::TransportError, std::string("out of memory creating ") + method + " call");
    }
    return Message(msg);
}

Message call(DBusConnection* conn, DBusMessage* msg, int timeout_ms,
             std::initializer_list<const char*> tolerated) {
    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, &err);

    if (dbus_error_is_set(&err)) {
        const char* member = dbus_message_get_member(msg);
        for (const char* t : tolerated) {
            if (err.message && strstr(err.message, t)) {
                aranet::log::debug() << "dbus: " << (member ? member : "call") << ": " << err.message
                                     << " (ignored)" << std::endl;
                dbus_error_free(&err);
                if (reply) dbus_message_unref(reply);
                return Message();
            }
        }

        std::string message = std::string(member ? member : "call") + " failed: " +
                              (err.message ? err.message : "unknown error");
        dbus_error_free(&err);
        if (reply) dbus_message_unref(reply);
        throw Error(ErrorKind::TransportError, message);
    }

    if (!reply) {
        throw Error(ErrorKind::TransportError, "no reply from D-Bus");
    }
    return Message(reply);
}

// Properties.Get, returns the reply positioned for reading the variant
static Message get_property(DBusConnection* conn, const char* path, const char* iface, const char* prop) {
    auto msg = new_method_call("org.bluez", path, "org.freedesktop.DBus.Properties", "Get");
    dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);
    return call(conn, msg.get(), 2000);
}

std::optional<std::string> get_string_property(DBusConnection* conn, const char* path,
                                               const char* iface, const char* prop) {
    auto reply = get_property(conn, path, iface, prop);

    DBusMessageIter iter, variant;
    if (dbus_message_iter_init(reply.get(), &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&iter, &variant);
        return read_string(&variant);
    }
    return std::nullopt;
}

std::optional<bool> get_bool_property(DBusConnection* conn, const char* path,
                                      const char* iface, const char* prop) {
    auto reply = get_property(conn, path, iface, prop);

    DBusMessageIter iter, variant;
    if (dbus_message_iter_init(reply.get(), &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&iter, &variant);
        if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BOOLEAN) {
            dbus_bool_t val;
            dbus_message_iter_get_basic(&variant, &val);
            return val != 0;
        }
    }
    return std::nullopt;
}

std::optional<uint8_t> get_byte_property(DBusConnection* conn, const char* path,
                                         const char* iface, const char* prop) {
    auto reply = get_property(conn, path, iface, prop);

    DBusMessageIter iter, variant;
    if (dbus_message_iter_init(reply.get(), &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&iter, &variant);
        if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BYTE) {
            uint8_t val;
            dbus_message_iter_get_basic(&variant, &val);
            return val;
        }
    }
    return std::nullopt;
}

std::vector<uint8_t> read_byte_array(DBusMessageIter* iter) {
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
        dbus_message_iter_get_element_type(iter) != DBUS_TYPE_BYTE) {
        return {};
    }

    DBusMessageIter array_iter;
    dbus_message_iter_recurse(iter, &array_iter);

    const uint8_t* bytes = nullptr;
    int count = 0;
    dbus_message_iter_get_fixed_array(&array_iter, &bytes, &count);
    if (!bytes || count <= 0) {
        return {};
    }
    return std::vector<uint8_t>(bytes, bytes + count);
}

std::vector<std::string> read_string_array(DBusMessageIter* iter) {
    std::vector<std::string> result;
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
        return result;
    }

    DBusMessageIter array_iter;
    dbus_message_iter_recurse(iter, &array_iter);

    while (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_STRING) {
        const char* value;
        dbus_message_iter_get_basic(&array_iter, &value);
        result.emplace_back(value);
        dbus_message_iter_next(&array_iter);
    }
    return result;
}

std::optional<std::string> read_string(DBusMessageIter* iter) {
    int type = dbus_message_iter_get_arg_type(iter);
    if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) {
        return std::nullopt;
    }
    const char* value;
    dbus_message_iter_get_basic(iter, &value);
    return std::string(value);
}

bool find_property(DBusMessageIter* props, const char* name, DBusMessageIter* variant) {
    if (dbus_message_iter_get_arg_type(props) != DBUS_TYPE_ARRAY) {
        return false;
    }

    DBusMessageIter dict;
    dbus_message_iter_recurse(props, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&dict, &entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&entry, &prop_name);
        dbus_message_iter_next(&entry);

        if (strcmp(prop_name, name) == 0 &&
            dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&entry, variant);
            return true;
        }
        dbus_message_iter_next(&dict);
    }
    return false;
}

void append_dict_entry_string(DBusMessageIter* dict, const char* key, const char* value) {
    DBusMessageIter entry, variant;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

void append_dict_entry_bool(DBusMessageIter* dict, const char* key, bool value) {
    DBusMessageIter entry, variant;
    dbus_bool_t val = value ? TRUE : FALSE;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &val);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

void append_dict_entry_string_array(DBusMessageIter* dict, const char* key,
                                    const std::vector<std::string>& values) {
    DBusMessageIter entry, variant, array;
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "as", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "s", &array);
    for (const auto& value : values) {
        const char* s = value.c_str();
        dbus_message_iter_append_basic(&array, DBUS_TYPE_STRING, &s);
    }
    dbus_message_iter_close_container(&variant, &array);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

void for_each_managed_object(DBusConnection* conn, const ObjectVisitor& fn) {
    auto msg = new_method_call("org.bluez", "/", "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    auto reply = call(conn, msg.get(), 5000);

    // a{oa{sa{sv}}}
    DBusMessageIter iter, objects;
    if (!dbus_message_iter_init(reply.get(), &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        throw Error(ErrorKind::TransportError, "unexpected GetManagedObjects reply");
    }

    dbus_message_iter_recurse(&iter, &objects);

    while (dbus_message_iter_get_arg_type(&objects) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry, ifaces;
        dbus_message_iter_recurse(&objects, &entry);

        const char* obj_path;
        dbus_message_iter_get_basic(&entry, &obj_path);
        dbus_message_iter_next(&entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
            dbus_message_iter_recurse(&entry, &ifaces);

            while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter iface_entry;
                dbus_message_iter_recurse(&ifaces, &iface_entry);

                const char* iface_name;
                dbus_message_iter_get_basic(&iface_entry, &iface_name);
                dbus_message_iter_next(&iface_entry);

                fn(obj_path, iface_name, &iface_entry);

                dbus_message_iter_next(&ifaces);
            }
        }

        dbus_message_iter_next(&objects);
    }
}

} // namespace dbus_client
