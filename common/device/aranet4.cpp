#include "aranet4.hpp"
#include "../discovery/discovery.hpp"
#include "../log.hpp"
#include "../protocol/parse.hpp"
#include "../protocol/uuids.hpp"
#include <algorithm>

namespace aranet {

static bool has_service(const std::vector<std::string>& services, const char* uuid) {
    return std::any_of(services.begin(), services.end(),
                       [uuid](const std::string& s) { return uuids::equal(s, uuid); });
}

Aranet4 Aranet4::open(std::shared_ptr<transport::Peripheral> peripheral) {
    if (!peripheral || !peripheral->is_connected()) {
        throw Error(ErrorKind::NotConnected, "peripheral is not connected");
    }

    auto services = peripheral->services();
    if (services.empty()) {
        log::debug() << "aranet: discovering services on " << peripheral->id() << std::endl;
        peripheral->discover_services();
        services = peripheral->services();
    }

    if (!has_service(services, uuids::AR4_SERVICE)) {
        if (has_service(services, uuids::AR4_OLD_SERVICE)) {
            throw Error(ErrorKind::UnsupportedDevice,
                        "device is an Aranet4 with firmware older than v1.2.0, please update it");
        }
        throw Error(ErrorKind::UnsupportedDevice, "device is not an Aranet4 device (or firmware is not v1.2.0+)");
    }

    return Aranet4(std::move(peripheral));
}

std::vector<uint8_t> Aranet4::read_raw(const Characteristic& characteristic) const {
    if (!peripheral_->is_connected()) {
        throw Error(ErrorKind::NotConnected, "peripheral is not connected");
    }
    return peripheral_->read(characteristic);
}

uint16_t Aranet4::read_u16(const Characteristic& characteristic, const char* what) const {
    auto raw = read_raw(characteristic);
    auto value = parse::parse_u16_le(raw);
    if (!value) {
        throw Error(ErrorKind::MalformedInput,
                    std::string("expected ") + what + " to be a 2-byte little endian integer, got " +
                    std::to_string(raw.size()) + " bytes");
    }
    return *value;
}

std::string Aranet4::read_string(const Characteristic& characteristic, const char* what) const {
    auto raw = read_raw(characteristic);
    auto value = parse::parse_utf8(raw);
    if (!value) {
        throw Error(ErrorKind::EncodingError, std::string(what) + " is not valid UTF-8");
    }
    return std::move(*value);
}

CurrentReading Aranet4::read_current() const {
    auto raw = read_raw(characteristics::CURRENT_READINGS);
    auto reading = parse::parse_current_reading(raw);
    if (!reading) {
        throw Error(ErrorKind::MalformedInput,
                    "malformed current readings (" + std::to_string(raw.size()) + " bytes, expected 9)");
    }
    return *reading;
}

CurrentReadingDetailed Aranet4::read_current_detailed() const {
    auto raw = read_raw(characteristics::CURRENT_READINGS_DET);
    auto reading = parse::parse_current_reading_detailed(raw);
    if (!reading) {
        throw Error(ErrorKind::MalformedInput,
                    "malformed detailed current readings (" + std::to_string(raw.size()) +
                    " bytes, expected 13)");
    }
    return *reading;
}

uint16_t Aranet4::read_interval() const {
    return read_u16(characteristics::INTERVAL, "interval");
}

uint16_t Aranet4::read_last_update_age() const {
    return read_u16(characteristics::SECONDS_SINCE_UPDATE, "last update age");
}

uint16_t Aranet4::read_total_readings() const {
    return read_u16(characteristics::TOTAL_READINGS, "total readings");
}

uint8_t Aranet4::read_battery_level() const {
    auto raw = read_raw(characteristics::BATTERY_LEVEL);
    auto level = parse::parse_u8(raw);
    if (!level) {
        throw Error(ErrorKind::MalformedInput,
                    "expected battery level to be 1 byte, got " + std::to_string(raw.size()));
    }
    return *level;
}

std::string Aranet4::read_name() const {
    return read_string(characteristics::DEVICE_NAME, "device name");
}

std::string Aranet4::read_firmware_version_string() const {
    return read_string(characteristics::SW_REV, "firmware version");
}

DeviceInformation Aranet4::read_device_information() const {
    DeviceInformation info;
    info.manufacturer = read_string(characteristics::MANUFACTURER_NAME, "manufacturer name");
    info.model_number = read_string(characteristics::MODEL_NUMBER, "model number");
    info.serial_number = read_string(characteristics::SERIAL_NO, "serial number");
    info.hardware_revision = read_string(characteristics::HW_REV, "hardware revision");
    info.software_revision = read_string(characteristics::SW_REV, "software revision");
    info.factory_software_revision = read_string(characteristics::FACTORY_SW_REV, "factory software revision");
    return info;
}

Aranet4 connect(const DiscoveredDevice& discovered) {
    if (!discovered.adapter) {
        throw Error(ErrorKind::TransportError, "advertisement has no adapter");
    }

    auto peripheral = discovered.adapter->peripheral(discovered.peripheral_id);
    if (!peripheral) {
        throw Error(ErrorKind::TransportError, "adapter does not know " + discovered.peripheral_id);
    }

    if (!peripheral->is_connected()) {
        log::info() << "aranet: connecting to " << discovered.peripheral_id << std::endl;
        peripheral->connect();
    }

    return Aranet4::open(std::move(peripheral));
}

} // namespace aranet
