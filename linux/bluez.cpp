#include "bluez.hpp"
#include <log.hpp>
#include <types/error.hpp>

#include <unistd.h>

#include <algorithm>
#include <cstring>

using aranet::Error;
using aranet::ErrorKind;
using aranet::transport::CentralEvent;
using aranet::transport::CentralEventKind;

namespace bluez {

namespace log = aranet::log;

std::string device_path(const std::string& adapter_path, const std::string& mac_address) {
    std::string result = mac_address;
    std::replace(result.begin(), result.end(), ':', '_');
    return adapter_path + "/dev_" + result;
}

std::optional<std::string> address_from_path(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    std::string element = path.substr(slash + 1);
    if (element.size() != 4 + 17 || element.compare(0, 4, "dev_") != 0) {
        return std::nullopt;
    }

    std::string address = element.substr(4);
    std::replace(address.begin(), address.end(), '_', ':');
    return address;
}

std::string adapter_name(const std::string& adapter_path) {
    auto slash = adapter_path.rfind('/');
    return slash == std::string::npos ? adapter_path : adapter_path.substr(slash + 1);
}

bool is_child_path(const std::string& path, const std::string& parent) {
    return path.size() > parent.size() + 1 &&
           path.compare(0, parent.size(), parent) == 0 &&
           path[parent.size()] == '/';
}

ClaimedRead claimed_read(const aranet::Characteristic& characteristic) {
    namespace uuids = aranet::uuids;

    if (uuids::equal(characteristic.service_uuid, uuids::GENERIC_SERVICE)) {
        return uuids::equal(characteristic.uuid, uuids::GENERIC_READ_DEVICE_NAME) ? ClaimedRead::DeviceName
                                                                                : ClaimedRead::None;
    }
    if (uuids::equal(characteristic.service_uuid, uuids::BATTERY_SERVICE)) {
        return uuids::equal(characteristic.uuid, uuids::BATTERY_READ) ? ClaimedRead::BatteryPercentage
                                                                      : ClaimedRead::None;
    }
    if (uuids::equal(characteristic.service_uuid, uuids::COMMON_SERVICE)) {
        return ClaimedRead::DeviceInformation;
    }
    return ClaimedRead::None;
}

std::map<uint16_t, std::vector<uint8_t>> read_manufacturer_data(DBusMessageIter* iter) {
    std::map<uint16_t, std::vector<uint8_t>> result;

    // ManufacturerData is a{qv} - dict of uint16 -> variant(array of bytes)
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
        return result;
    }

    DBusMessageIter dict;
    dbus_message_iter_recurse(iter, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&dict, &entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_UINT16) {
            uint16_t mfr_id;
            dbus_message_iter_get_basic(&entry, &mfr_id);
            dbus_message_iter_next(&entry);

            if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
                DBusMessageIter variant;
                dbus_message_iter_recurse(&entry, &variant);
                result[mfr_id] = dbus_client::read_byte_array(&variant);
            }
        }
        dbus_message_iter_next(&dict);
    }
    return result;
}

std::map<std::string, std::vector<uint8_t>> read_service_data(DBusMessageIter* iter) {
    std::map<std::string, std::vector<uint8_t>> result;

    // ServiceData is a{sv} - dict of UUID -> variant(array of bytes)
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY) {
        return result;
    }

    DBusMessageIter dict;
    dbus_message_iter_recurse(iter, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&dict, &entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_STRING) {
            const char* uuid;
            dbus_message_iter_get_basic(&entry, &uuid);
            dbus_message_iter_next(&entry);

            if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
                DBusMessageIter variant;
                dbus_message_iter_recurse(&entry, &variant);
                result[uuid] = dbus_client::read_byte_array(&variant);
            }
        }
        dbus_message_iter_next(&dict);
    }
    return result;
}

// ---------------------------------------------------------------------------
// Peripheral
// ---------------------------------------------------------------------------

Peripheral::Peripheral(std::shared_ptr<Bus> bus, std::string path, std::string address)
    : bus_(std::move(bus)), path_(std::move(path)), address_(std::move(address)) {}

bool Peripheral::is_connected() {
    auto connected = dbus_client::get_bool_property(bus_->get(), path_.c_str(), DEVICE_INTERFACE, "Connected");
    return connected.value_or(false);
}

void Peripheral::connect() {
    auto msg = dbus_client::new_method_call(SERVICE, path_.c_str(), DEVICE_INTERFACE, "Connect");
    dbus_client::call(bus_->get(), msg.get(), CONNECT_TIMEOUT_MS, {"Already", "already"});
    log::info() << "bluez: connected to " << address_ << std::endl;
}

void Peripheral::discover_services() {
    // BlueZ resolves services on its own after connecting, wait for it
    for (int waited = 0; waited < SERVICES_RESOLVED_TIMEOUT_MS; waited += 100) {
        auto resolved = dbus_client::get_bool_property(bus_->get(), path_.c_str(), DEVICE_INTERFACE,
                                                       "ServicesResolved");
        if (resolved.value_or(false)) {
            log::debug() << "bluez: services resolved on " << address_ << std::endl;
            return;
        }
        if (!is_connected()) {
            throw Error(ErrorKind::NotConnected, address_ + " disconnected during service discovery");
        }
        usleep(100000);  // 100ms
    }

    throw Error(ErrorKind::TransportError, "timed out waiting for services of " + address_);
}

std::vector<std::string> Peripheral::services() {
    std::vector<std::string> result;

    dbus_client::for_each_managed_object(bus_->get(),
        [&](const char* path, const char* iface, DBusMessageIter* props) {
            if (strcmp(iface, GATT_SERVICE_INTERFACE) != 0 || !is_child_path(path, path_)) {
                return;
            }
            DBusMessageIter variant;
            if (dbus_client::find_property(props, "UUID", &variant)) {
                if (auto uuid = dbus_client::read_string(&variant)) {
                    result.push_back(std::move(*uuid));
                }
            }
        });

    return result;
}

std::optional<std::string> Peripheral::find_characteristic(const aranet::Characteristic& characteristic) {
    std::map<std::string, std::string> service_uuids;  // path -> UUID
    struct Candidate {
        std::string path;
        std::string service;
    };
    std::vector<Candidate> candidates;

    dbus_client::for_each_managed_object(bus_->get(),
        [&](const char* path, const char* iface, DBusMessageIter* props) {
            if (!is_child_path(path, path_)) {
                return;
            }

            DBusMessageIter variant;
            if (strcmp(iface, GATT_SERVICE_INTERFACE) == 0) {
                if (dbus_client::find_property(props, "UUID", &variant)) {
                    if (auto uuid = dbus_client::read_string(&variant)) {
                        service_uuids[path] = *uuid;
                    }
                }
            } else if (strcmp(iface, GATT_CHARACTERISTIC_INTERFACE) == 0) {
                if (!dbus_client::find_property(props, "UUID", &variant)) {
                    return;
                }
                auto uuid = dbus_client::read_string(&variant);
                if (!uuid || !aranet::uuids::equal(*uuid, characteristic.uuid)) {
                    return;
                }

                Candidate candidate{path, {}};
                if (dbus_client::find_property(props, "Service", &variant)) {
                    candidate.service = dbus_client::read_string(&variant).value_or("");
                }
                candidates.push_back(std::move(candidate));
            }
        });

    for (const auto& candidate : candidates) {
        auto it = service_uuids.find(candidate.service);
        if (it != service_uuids.end() && aranet::uuids::equal(it->second, characteristic.service_uuid)) {
            return candidate.path;
        }
    }
    return std::nullopt;
}

std::vector<uint8_t> Peripheral::read_claimed(const aranet::Characteristic& characteristic, ClaimedRead route) {
    switch (route) {
        case ClaimedRead::DeviceName: {
            auto name = dbus_client::get_string_property(bus_->get(), path_.c_str(), DEVICE_INTERFACE, "Name");
            if (!name) {
                throw Error(ErrorKind::TransportError, "no device name known for " + address_);
            }
            return std::vector<uint8_t>(name->begin(), name->end());
        }
        case ClaimedRead::BatteryPercentage: {
            auto percentage = dbus_client::get_byte_property(bus_->get(), path_.c_str(),
                                                             BATTERY_INTERFACE, "Percentage");
            if (!percentage) {
                throw Error(ErrorKind::TransportError, "no battery percentage known for " + address_);
            }
            return {*percentage};
        }
        case ClaimedRead::DeviceInformation:
            throw Error(ErrorKind::TransportError,
                        std::string("characteristic ") + characteristic.uuid +
                        " is in the Device Information service, which bluetoothd's deviceinfo plugin"
                        " claims and does not export (run bluetoothd with -P deviceinfo to read it)");
        case ClaimedRead::None:
            break;
    }
    throw Error(ErrorKind::TransportError,
                std::string("characteristic ") + characteristic.uuid + " not found on " + address_);
}

std::vector<uint8_t> Peripheral::read(const aranet::Characteristic& characteristic) {
    // Exported characteristics win, claimed services are only exported
    // when bluetoothd runs without the plugin
    auto char_path = find_characteristic(characteristic);
    if (!char_path) {
        auto route = claimed_read(characteristic);
        log::debug() << "bluez: " << characteristic.uuid << " not exported on " << address_
                     << ", reading claimed value" << std::endl;
        return read_claimed(characteristic, route);
    }

    auto msg = dbus_client::new_method_call(SERVICE, char_path->c_str(), GATT_CHARACTERISTIC_INTERFACE, "ReadValue");

    // ReadValue(a{sv} options), no options
    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(msg.get(), &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dbus_message_iter_close_container(&iter, &dict);

    auto reply = dbus_client::call(bus_->get(), msg.get(), CALL_TIMEOUT_MS);

    DBusMessageIter reply_iter;
    if (!dbus_message_iter_init(reply.get(), &reply_iter) ||
        dbus_message_iter_get_arg_type(&reply_iter) != DBUS_TYPE_ARRAY) {
        throw Error(ErrorKind::TransportError,
                    std::string("unexpected ReadValue reply for ") + characteristic.uuid);
    }

    auto value = dbus_client::read_byte_array(&reply_iter);
    log::trace() << "bluez: read " << value.size() << " bytes from " << characteristic.uuid << std::endl;
    return value;
}

// ---------------------------------------------------------------------------
// EventStream
// ---------------------------------------------------------------------------

static void add_match(DBusConnection* conn, const std::string& rule) {
    DBusError err;
    dbus_error_init(&err);

    dbus_bus_add_match(conn, rule.c_str(), &err);
    if (dbus_error_is_set(&err)) {
        std::string message = "failed to add match " + rule + ": " + err.message;
        dbus_error_free(&err);
        throw Error(ErrorKind::TransportError, message);
    }
}

EventStream::EventStream(dbus_client::Connection connection, std::string adapter_path)
    : connection_(std::move(connection)), adapter_path_(std::move(adapter_path)) {
    DBusConnection* conn = connection_.get();

    // Device properties below this adapter (advertisements, connection state)
    add_match(conn,
        "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.Properties',"
        "member='PropertiesChanged',arg0='org.bluez.Device1',path_namespace='" + adapter_path_ + "'");

    // New devices discovered
    add_match(conn,
        "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.ObjectManager',member='InterfacesAdded'");

    // Adapter unplugged
    add_match(conn,
        "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.ObjectManager',member='InterfacesRemoved'");

    if (!dbus_connection_add_filter(conn, filter, this, nullptr)) {
        throw Error(ErrorKind::TransportError, "failed to add D-Bus filter");
    }
    dbus_connection_flush(conn);
}

EventStream::~EventStream() {
    if (connection_.is_open()) {
        dbus_connection_remove_filter(connection_.get(), filter, this);
    }
}

std::optional<CentralEvent> EventStream::next(std::chrono::milliseconds timeout) {
    DBusConnection* conn = connection_.get();

    // Messages already read but not yet turned into events
    while (pending_.empty() && dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {}

    if (pending_.empty() && !ended_) {
        if (!dbus_connection_read_write(conn, static_cast<int>(timeout.count()))) {
            log::warn() << "bluez: " << adapter_name(adapter_path_) << " lost the system bus" << std::endl;
            ended_ = true;
        } else {
            while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {}
        }
    }

    if (pending_.empty()) {
        return std::nullopt;
    }

    CentralEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

DBusHandlerResult EventStream::filter(DBusConnection* conn, DBusMessage* msg, void* user_data) {
    (void)conn;
    auto* self = static_cast<EventStream*>(user_data);

    if (dbus_message_get_type(msg) != DBUS_MESSAGE_TYPE_SIGNAL) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    if (dbus_message_is_signal(msg, "org.freedesktop.DBus.Properties", "PropertiesChanged")) {
        self->handle_properties_changed(msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }
    if (dbus_message_is_signal(msg, "org.freedesktop.DBus.ObjectManager", "InterfacesAdded")) {
        self->handle_interfaces_added(msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }
    if (dbus_message_is_signal(msg, "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved")) {
        self->handle_interfaces_removed(msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }
    if (dbus_message_is_signal(msg, DBUS_INTERFACE_LOCAL, "Disconnected")) {
        self->ended_ = true;
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

void EventStream::push_property_events(const std::string& address, DBusMessageIter* props) {
    DBusMessageIter dict;
    dbus_message_iter_recurse(props, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry, variant;
        dbus_message_iter_recurse(&dict, &entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&entry, &prop_name);
        dbus_message_iter_next(&entry);

        if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&entry, &variant);

            CentralEvent event;
            event.id = address;

            if (strcmp(prop_name, "ManufacturerData") == 0) {
                event.kind = CentralEventKind::ManufacturerDataAdvertisement;
                event.manufacturer_data = read_manufacturer_data(&variant);
                pending_.push_back(std::move(event));
            } else if (strcmp(prop_name, "ServiceData") == 0) {
                event.kind = CentralEventKind::ServiceDataAdvertisement;
                event.service_data = read_service_data(&variant);
                pending_.push_back(std::move(event));
            } else if (strcmp(prop_name, "UUIDs") == 0) {
                event.kind = CentralEventKind::ServicesAdvertisement;
                event.services = dbus_client::read_string_array(&variant);
                pending_.push_back(std::move(event));
            } else if (strcmp(prop_name, "Connected") == 0 &&
                       dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BOOLEAN) {
                dbus_bool_t connected;
                dbus_message_iter_get_basic(&variant, &connected);
                event.kind = connected ? CentralEventKind::DeviceConnected
                                       : CentralEventKind::DeviceDisconnected;
                pending_.push_back(std::move(event));
            }
        }
        dbus_message_iter_next(&dict);
    }
}

void EventStream::handle_interfaces_added(DBusMessage* msg) {
    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) return;

    // First arg: object path
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_OBJECT_PATH) return;
    const char* obj_path;
    dbus_message_iter_get_basic(&iter, &obj_path);

    // Only devices of this adapter
    if (!is_child_path(obj_path, adapter_path_)) return;
    auto address = address_from_path(obj_path);
    if (!address) return;

    // Second arg: interfaces dict
    dbus_message_iter_next(&iter);
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter ifaces;
    dbus_message_iter_recurse(&iter, &ifaces);

    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&ifaces, &entry);

        const char* iface_name;
        dbus_message_iter_get_basic(&entry, &iface_name);
        dbus_message_iter_next(&entry);

        if (strcmp(iface_name, DEVICE_INTERFACE) == 0 &&
            dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
            log::debug() << "bluez: discovered " << *address << " on " << adapter_name(adapter_path_) << std::endl;

            CentralEvent discovered;
            discovered.kind = CentralEventKind::DeviceDiscovered;
            discovered.id = *address;
            pending_.push_back(std::move(discovered));

            push_property_events(*address, &entry);
        }
        dbus_message_iter_next(&ifaces);
    }
}

void EventStream::handle_interfaces_removed(DBusMessage* msg) {
    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) return;

    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_OBJECT_PATH) return;
    const char* obj_path;
    dbus_message_iter_get_basic(&iter, &obj_path);

    if (adapter_path_ != obj_path) return;

    dbus_message_iter_next(&iter);
    auto removed = dbus_client::read_string_array(&iter);
    if (std::find(removed.begin(), removed.end(), ADAPTER_INTERFACE) != removed.end()) {
        log::warn() << "bluez: adapter " << adapter_name(adapter_path_) << " was removed" << std::endl;
        ended_ = true;
    }
}

void EventStream::handle_properties_changed(DBusMessage* msg) {
    const char* obj_path = dbus_message_get_path(msg);
    if (!obj_path || !is_child_path(obj_path, adapter_path_)) return;

    auto address = address_from_path(obj_path);
    if (!address) return;

    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter)) return;

    // First arg: interface name
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) return;
    const char* changed_iface;
    dbus_message_iter_get_basic(&iter, &changed_iface);
    if (strcmp(changed_iface, DEVICE_INTERFACE) != 0) return;

    // Second arg: changed properties dict
    dbus_message_iter_next(&iter);
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) return;

    CentralEvent updated;
    updated.kind = CentralEventKind::DeviceUpdated;
    updated.id = *address;
    pending_.push_back(std::move(updated));

    push_property_events(*address, &iter);
}

// ---------------------------------------------------------------------------
// Adapter
// ---------------------------------------------------------------------------

Adapter::Adapter(std::shared_ptr<Bus> bus, std::string path)
    : bus_(std::move(bus)), path_(std::move(path)) {}

void Adapter::start_scan(const aranet::transport::ScanFilter& filter) {
    auto msg = dbus_client::new_method_call(SERVICE, path_.c_str(), ADAPTER_INTERFACE, "SetDiscoveryFilter");

    // SetDiscoveryFilter(a{sv} filter)
    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(msg.get(), &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    if (!filter.services.empty()) {
        dbus_client::append_dict_entry_string_array(&dict, "UUIDs", filter.services);
    }
    dbus_client::append_dict_entry_string(&dict, "Transport", "le");
    // Report every advertisement, not only changed ones
    dbus_client::append_dict_entry_bool(&dict, "DuplicateData", true);
    dbus_message_iter_close_container(&iter, &dict);

    dbus_client::call(bus_->get(), msg.get(), CALL_TIMEOUT_MS);

    // "Already" errors are OK (another client is discovering)
    auto start = dbus_client::new_method_call(SERVICE, path_.c_str(), ADAPTER_INTERFACE, "StartDiscovery");
    dbus_client::call(bus_->get(), start.get(), CALL_TIMEOUT_MS, {"Already", "already", "InProgress"});

    log::debug() << "bluez: started discovery on " << path_ << std::endl;
}

void Adapter::stop_scan() {
    auto msg = dbus_client::new_method_call(SERVICE, path_.c_str(), ADAPTER_INTERFACE, "StopDiscovery");
    dbus_client::call(bus_->get(), msg.get(), CALL_TIMEOUT_MS, {"No discovery started"});
    log::debug() << "bluez: stopped discovery on " << path_ << std::endl;
}

std::unique_ptr<aranet::transport::EventStream> Adapter::events() {
    // Own connection so the worker can block on it without stalling method calls
    return std::make_unique<EventStream>(dbus_client::open_system_bus(), path_);
}

std::shared_ptr<aranet::transport::Peripheral> Adapter::peripheral(const aranet::transport::PeripheralId& id) {
    return std::make_shared<Peripheral>(bus_, device_path(path_, id), id);
}

// ---------------------------------------------------------------------------
// Central
// ---------------------------------------------------------------------------

Central::Central() {
    // Workers use their own connections while the main thread calls methods
    dbus_threads_init_default();
    bus_ = std::make_shared<Bus>(dbus_client::open_system_bus());
}

std::vector<std::shared_ptr<aranet::transport::Adapter>> Central::adapters() {
    std::vector<std::string> paths;

    dbus_client::for_each_managed_object(bus_->get(),
        [&](const char* path, const char* iface, DBusMessageIter*) {
            if (strcmp(iface, ADAPTER_INTERFACE) == 0) {
                paths.emplace_back(path);
            }
        });

    std::sort(paths.begin(), paths.end());

    std::vector<std::shared_ptr<aranet::transport::Adapter>> result;
    for (auto& path : paths) {
        log::debug() << "bluez: found adapter " << path << std::endl;
        result.push_back(std::make_shared<Adapter>(bus_, std::move(path)));
    }
    return result;
}

} // namespace bluez
