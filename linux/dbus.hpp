#pragma once

#include <dbus/dbus.h>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Thin helpers over libdbus for talking to BlueZ. Failures are reported as
// aranet::Error with ErrorKind::TransportError.
namespace dbus_client {

// Owns a private connection to the system bus
class Connection {
public:
    Connection() = default;
    explicit Connection(DBusConnection* conn) : conn_(conn) {}
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    DBusConnection* get() const { return conn_; }
    bool is_open() const { return conn_ != nullptr; }
    void close();

private:
    DBusConnection* conn_ = nullptr;
};

// New private system bus connection that does not exit the process on disconnect
Connection open_system_bus();

struct MessageDeleter {
    void operator()(DBusMessage* msg) const { dbus_message_unref(msg); }
};
using Message = std::unique_ptr<DBusMessage, MessageDeleter>;

Message new_method_call(const char* dest, const char* path, const char* iface, const char* method);

// Send and block for the reply. Errors whose message contains one of
// `tolerated` are treated as success and yield an empty Message.
Message call(DBusConnection* conn, DBusMessage* msg, int timeout_ms,
             std::initializer_list<const char*> tolerated = {});

// org.freedesktop.DBus.Properties.Get on a BlueZ object.
// nullopt if the property has a different type.
std::optional<std::string> get_string_property(DBusConnection* conn, const char* path,
                                               const char* iface, const char* prop);
std::optional<bool> get_bool_property(DBusConnection* conn, const char* path,
                                      const char* iface, const char* prop);
std::optional<uint8_t> get_byte_property(DBusConnection* conn, const char* path,
                                         const char* iface, const char* prop);

// Readers for values inside a message. The iterator must point at the value.
std::vector<uint8_t> read_byte_array(DBusMessageIter* iter);       // ay
std::vector<std::string> read_string_array(DBusMessageIter* iter); // as
std::optional<std::string> read_string(DBusMessageIter* iter);     // s or o

// Find `name` in an a{sv} dict and point `variant` at its contents
bool find_property(DBusMessageIter* props, const char* name, DBusMessageIter* variant);

// Writers for a{sv} dicts
void append_dict_entry_string(DBusMessageIter* dict, const char* key, const char* value);
void append_dict_entry_bool(DBusMessageIter* dict, const char* key, bool value);
void append_dict_entry_string_array(DBusMessageIter* dict, const char* key,
                                    const std::vector<std::string>& values);

// Walk org.freedesktop.DBus.ObjectManager.GetManagedObjects on BlueZ and call
// `fn` for every interface of every object, with `props` at its a{sv}.
using ObjectVisitor = std::function<void(const char* path, const char* iface, DBusMessageIter* props)>;
void for_each_managed_object(DBusConnection* conn, const ObjectVisitor& fn);

} // namespace dbus_client
