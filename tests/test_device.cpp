/*
 * Unit tests for the Aranet4 device abstraction against a fake peripheral
 */

#include <gtest/gtest.h>
#include "device/aranet4.hpp"
#include "discovery/discovery.hpp"
#include "fake_transport.hpp"
#include "protocol/uuids.hpp"

using namespace aranet;

static std::shared_ptr<fake::Peripheral> make_aranet4() {
    auto p = std::make_shared<fake::Peripheral>("AA:BB:CC:DD:EE:01");
    p->set_services({uuids::GENERIC_SERVICE, uuids::COMMON_SERVICE, uuids::AR4_SERVICE, uuids::BATTERY_SERVICE});

    p->values[uuids::AR4_READ_CURRENT_READINGS] = {0x20, 0x03, 0x90, 0x01, 0x92, 0x27, 0x2D, 0x50, 0x01};
    p->values[uuids::AR4_READ_CURRENT_READINGS_DET] = {
        0x20, 0x03, 0x90, 0x01, 0x92, 0x27, 0x2D, 0x50, 0x01, 0x2C, 0x01, 0x78, 0x00};
    p->values[uuids::AR4_READ_INTERVAL] = {0x2C, 0x01};
    p->values[uuids::AR4_READ_SECONDS_SINCE_UPDATE] = {0x2A, 0x00};
    p->values[uuids::AR4_READ_TOTAL_READINGS] = {0x10, 0x27};
    p->values[uuids::BATTERY_READ] = {87};
    p->values[uuids::GENERIC_READ_DEVICE_NAME] = {'A', 'r', 'a', 'n', 'e', 't', '4', ' ', '0', '1'};
    p->values[uuids::COMMON_READ_MANUFACTURER_NAME] = {'S', 'A', 'F'};
    p->values[uuids::COMMON_READ_MODEL_NUMBER] = {'4'};
    p->values[uuids::COMMON_READ_SERIAL_NO] = {'1', '2', '3'};
    p->values[uuids::COMMON_READ_HW_REV] = {'1', '2'};
    p->values[uuids::COMMON_READ_FACTORY_SW_REV] = {'v', '0', '.', '3', '.', '1'};
    p->values[uuids::COMMON_READ_SW_REV] = {'v', '1', '.', '4', '.', '4'};
    return p;
}

template<typename F>
static ErrorKind error_kind_of(F&& f) {
    try {
        f();
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no aranet::Error thrown";
    return ErrorKind::TransportError;
}

// ============================================================================
// Test Suite: Aranet4Open
// ============================================================================

TEST(Aranet4Open, ConnectedWithService) {
    auto p = make_aranet4();
    auto device = Aranet4::open(p);
    EXPECT_EQ(device.peripheral(), p);
    EXPECT_EQ(p->discover_calls, 0);
}

TEST(Aranet4Open, NullPeripheral) {
    EXPECT_EQ(error_kind_of([] { Aranet4::open(nullptr); }), ErrorKind::NotConnected);
}

TEST(Aranet4Open, Disconnected) {
    auto p = make_aranet4();
    p->connected = false;
    EXPECT_EQ(error_kind_of([&] { Aranet4::open(p); }), ErrorKind::NotConnected);
}

TEST(Aranet4Open, DiscoversServicesWhenNoneKnown) {
    auto p = make_aranet4();
    p->set_services({});
    p->services_after_discovery = {uuids::AR4_SERVICE};
    Aranet4::open(p);
    EXPECT_EQ(p->discover_calls, 1);
}

TEST(Aranet4Open, ServiceMissingAfterDiscovery) {
    auto p = make_aranet4();
    p->set_services({});
    p->services_after_discovery = {uuids::GENERIC_SERVICE};
    EXPECT_EQ(error_kind_of([&] { Aranet4::open(p); }), ErrorKind::UnsupportedDevice);
    EXPECT_EQ(p->discover_calls, 1);
}

TEST(Aranet4Open, OtherDeviceUnsupported) {
    auto p = make_aranet4();
    p->set_services({uuids::GENERIC_SERVICE, uuids::BATTERY_SERVICE});
    EXPECT_EQ(error_kind_of([&] { Aranet4::open(p); }), ErrorKind::UnsupportedDevice);
}

TEST(Aranet4Open, LegacyFirmwareUnsupported) {
    auto p = make_aranet4();
    p->set_services({uuids::GENERIC_SERVICE, uuids::AR4_OLD_SERVICE});
    try {
        Aranet4::open(p);
        FAIL() << "legacy service accepted";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedDevice);
        EXPECT_NE(std::string(e.what()).find("v1.2.0"), std::string::npos);
    }
}

TEST(Aranet4Open, UppercaseServiceUuid) {
    auto p = make_aranet4();
    p->set_services({"0000FCE0-0000-1000-8000-00805F9B34FB"});
    EXPECT_NO_THROW(Aranet4::open(p));
}

// ============================================================================
// Test Suite: Aranet4Read
// ============================================================================

TEST(Aranet4Read, CurrentReading) {
    auto device = Aranet4::open(make_aranet4());
    auto r = device.read_current();
    EXPECT_EQ(r.co2_ppm, std::optional<uint16_t>(800));
    EXPECT_EQ(r.status, DisplayStatus::Green);
}

TEST(Aranet4Read, CurrentReadingDetailed) {
    auto device = Aranet4::open(make_aranet4());
    auto r = device.read_current_detailed();
    EXPECT_EQ(r.interval, 300);
    EXPECT_EQ(r.age, 120);
    EXPECT_FLOAT_EQ(r.battery, 0.80f);
}

TEST(Aranet4Read, Scalars) {
    auto device = Aranet4::open(make_aranet4());
    EXPECT_EQ(device.read_interval(), 300);
    EXPECT_EQ(device.read_last_update_age(), 42);
    EXPECT_EQ(device.read_total_readings(), 10000);
    EXPECT_EQ(device.read_battery_level(), 87);
}

TEST(Aranet4Read, Strings) {
    auto device = Aranet4::open(make_aranet4());
    EXPECT_EQ(device.read_name(), "Aranet4 01");
    EXPECT_EQ(device.read_firmware_version_string(), "v1.4.4");
}

TEST(Aranet4Read, DeviceInformation) {
    auto device = Aranet4::open(make_aranet4());
    auto info = device.read_device_information();
    EXPECT_EQ(info.manufacturer, "SAF");
    EXPECT_EQ(info.model_number, "4");
    EXPECT_EQ(info.serial_number, "123");
    EXPECT_EQ(info.hardware_revision, "12");
    EXPECT_EQ(info.software_revision, "v1.4.4");
    EXPECT_EQ(info.factory_software_revision, "v0.3.1");
}

TEST(Aranet4Read, EveryReadGoesToTheDevice) {
    auto p = make_aranet4();
    auto device = Aranet4::open(p);
    int before = p->read_calls;
    device.read_interval();
    device.read_interval();
    EXPECT_EQ(p->read_calls, before + 2);
}

TEST(Aranet4Read, DisconnectedAfterOpen) {
    auto p = make_aranet4();
    auto device = Aranet4::open(p);
    p->connected = false;
    EXPECT_EQ(error_kind_of([&] { device.read_current(); }), ErrorKind::NotConnected);
    EXPECT_EQ(error_kind_of([&] { device.read_name(); }), ErrorKind::NotConnected);
}

TEST(Aranet4Read, MalformedReading) {
    auto p = make_aranet4();
    p->values[uuids::AR4_READ_CURRENT_READINGS] = {0x20, 0x03, 0x90};
    p->values[uuids::AR4_READ_CURRENT_READINGS_DET][8] = 7;  // undefined status
    auto device = Aranet4::open(p);
    EXPECT_EQ(error_kind_of([&] { device.read_current(); }), ErrorKind::MalformedInput);
    EXPECT_EQ(error_kind_of([&] { device.read_current_detailed(); }), ErrorKind::MalformedInput);
}

TEST(Aranet4Read, MalformedScalars) {
    auto p = make_aranet4();
    p->values[uuids::AR4_READ_INTERVAL] = {0x2C, 0x01, 0x00};
    p->values[uuids::BATTERY_READ] = {};
    auto device = Aranet4::open(p);
    EXPECT_EQ(error_kind_of([&] { device.read_interval(); }), ErrorKind::MalformedInput);
    EXPECT_EQ(error_kind_of([&] { device.read_battery_level(); }), ErrorKind::MalformedInput);
}

TEST(Aranet4Read, InvalidUtf8Name) {
    auto p = make_aranet4();
    p->values[uuids::GENERIC_READ_DEVICE_NAME] = {'A', 0xFF, 'x'};
    auto device = Aranet4::open(p);
    EXPECT_EQ(error_kind_of([&] { device.read_name(); }), ErrorKind::EncodingError);
}

TEST(Aranet4Read, TransportErrorPassesThrough) {
    auto p = make_aranet4();
    p->values.erase(uuids::AR4_READ_TOTAL_READINGS);
    auto device = Aranet4::open(p);
    EXPECT_EQ(error_kind_of([&] { device.read_total_readings(); }), ErrorKind::TransportError);
}

// ============================================================================
// Test Suite: Aranet4Connect
// ============================================================================

TEST(Aranet4Connect, ConnectsDiscoveredDevice) {
    auto adapter = std::make_shared<fake::Adapter>("hci0");
    auto p = make_aranet4();
    p->connected = false;
    adapter->add_peripheral(p);

    DiscoveredDevice discovered;
    discovered.adapter = adapter;
    discovered.peripheral_id = p->id();

    auto device = aranet::connect(discovered);
    EXPECT_EQ(p->connect_calls, 1);
    EXPECT_EQ(device.read_interval(), 300);
}

TEST(Aranet4Connect, AlreadyConnected) {
    auto adapter = std::make_shared<fake::Adapter>("hci0");
    auto p = make_aranet4();
    adapter->add_peripheral(p);

    DiscoveredDevice discovered;
    discovered.adapter = adapter;
    discovered.peripheral_id = p->id();

    aranet::connect(discovered);
    EXPECT_EQ(p->connect_calls, 0);
}

TEST(Aranet4Connect, UnknownPeripheral) {
    DiscoveredDevice discovered;
    discovered.adapter = std::make_shared<fake::Adapter>("hci0");
    discovered.peripheral_id = "AA:BB:CC:DD:EE:99";
    EXPECT_EQ(error_kind_of([&] { aranet::connect(discovered); }), ErrorKind::TransportError);
}
