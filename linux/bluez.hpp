#pragma once

#include "dbus.hpp"
#include <transport/central.hpp>

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// BlueZ implementation of the transport interfaces, over the system D-Bus.
namespace bluez {

constexpr const char* SERVICE = "org.bluez";
constexpr const char* ADAPTER_INTERFACE = "org.bluez.Adapter1";
constexpr const char* DEVICE_INTERFACE = "org.bluez.Device1";
constexpr const char* GATT_SERVICE_INTERFACE = "org.bluez.GattService1";
constexpr const char* GATT_CHARACTERISTIC_INTERFACE = "org.bluez.GattCharacteristic1";
constexpr const char* BATTERY_INTERFACE = "org.bluez.Battery1";

constexpr int CALL_TIMEOUT_MS = 5000;
constexpr int CONNECT_TIMEOUT_MS = 30000;
constexpr int SERVICES_RESOLVED_TIMEOUT_MS = 15000;

// Get BlueZ device path from adapter path and MAC address
// ("/org/bluez/hci0", "AA:BB:CC:DD:EE:FF") -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
std::string device_path(const std::string& adapter_path, const std::string& mac_address);

// Inverse of device_path for the last path element, nullopt if not a device path
std::optional<std::string> address_from_path(const std::string& path);

// Last element of an adapter path, "/org/bluez/hci0" -> "hci0"
std::string adapter_name(const std::string& adapter_path);

// True if `path` is strictly below `parent` in the object tree
bool is_child_path(const std::string& path, const std::string& parent);

// Decode ManufacturerData (a{qv}) and ServiceData (a{sv}) property values
std::map<uint16_t, std::vector<uint8_t>> read_manufacturer_data(DBusMessageIter* iter);
std::map<std::string, std::vector<uint8_t>> read_service_data(DBusMessageIter* iter);

// GATT services bluetoothd claims through its own plugins (gap, battery,
// deviceinfo) are not exported as GattService1 objects. Characteristics in
// them are read from the Device1/Battery1 properties instead, where there
// is one.
enum class ClaimedRead {
    None,               // regular GATT ReadValue
    DeviceName,         // Device1.Name
    BatteryPercentage,  // Battery1.Percentage
    DeviceInformation,  // no D-Bus equivalent
};

ClaimedRead claimed_read(const aranet::Characteristic& characteristic);

// System bus connection shared by the adapters and peripherals for method
// calls. Requires dbus_threads_init_default(), done by Central.
using Bus = dbus_client::Connection;

class Peripheral : public aranet::transport::Peripheral {
public:
    Peripheral(std::shared_ptr<Bus> bus, std::string path, std::string address);

    aranet::transport::PeripheralId id() const override { return address_; }
    bool is_connected() override;
    void connect() override;
    void discover_services() override;
    std::vector<std::string> services() override;
    std::vector<uint8_t> read(const aranet::Characteristic& characteristic) override;

private:
    // Object path of the characteristic, looked up in GetManagedObjects
    std::optional<std::string> find_characteristic(const aranet::Characteristic& characteristic);

    // Value of a characteristic in a service claimed by bluetoothd
    std::vector<uint8_t> read_claimed(const aranet::Characteristic& characteristic, ClaimedRead route);

    std::shared_ptr<Bus> bus_;
    std::string path_;
    std::string address_;
};

class EventStream : public aranet::transport::EventStream {
public:
    EventStream(dbus_client::Connection connection, std::string adapter_path);
    ~EventStream() override;

    std::optional<aranet::transport::CentralEvent> next(std::chrono::milliseconds timeout) override;
    bool ended() const override { return ended_; }

private:
    static DBusHandlerResult filter(DBusConnection* conn, DBusMessage* msg, void* user_data);

    void handle_interfaces_added(DBusMessage* msg);
    void handle_interfaces_removed(DBusMessage* msg);
    void handle_properties_changed(DBusMessage* msg);

    // Events for the Device1 properties in `props` (a{sv})
    void push_property_events(const std::string& address, DBusMessageIter* props);

    dbus_client::Connection connection_;
    std::string adapter_path_;
    std::deque<aranet::transport::CentralEvent> pending_;
    std::atomic<bool> ended_{false};
};

class Adapter : public aranet::transport::Adapter {
public:
    Adapter(std::shared_ptr<Bus> bus, std::string path);

    std::string name() const override { return adapter_name(path_); }
    const std::string& path() const { return path_; }

    void start_scan(const aranet::transport::ScanFilter& filter) override;
    void stop_scan() override;
    std::unique_ptr<aranet::transport::EventStream> events() override;
    std::shared_ptr<aranet::transport::Peripheral> peripheral(const aranet::transport::PeripheralId& id) override;

private:
    std::shared_ptr<Bus> bus_;
    std::string path_;
};

class Central : public aranet::transport::Central {
public:
    // Connects to the system bus, throws aranet::Error (TransportError)
    Central();

    std::vector<std::shared_ptr<aranet::transport::Adapter>> adapters() override;

private:
    std::shared_ptr<Bus> bus_;
};

} // namespace bluez
