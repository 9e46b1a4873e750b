#pragma once

#include "../transport/central.hpp"
#include "../types/error.hpp"
#include "../types/reading.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace aranet {

struct DiscoveredDevice;

// Strongly typed Aranet4 on top of a connected peripheral.
// Every read goes to the device; nothing is cached.
//
// All operations throw aranet::Error:
//   NotConnected      - the peripheral dropped the connection
//   MalformedInput    - the device returned a payload of the wrong shape
//   EncodingError     - a string characteristic is not UTF-8
//   TransportError    - passed through from the Bluetooth stack
class Aranet4 {
public:
    // Verifies the peripheral is connected and exposes the Aranet4 service
    // (firmware v1.2.0+). Discovers services first if none are known yet.
    // Throws NotConnected or UnsupportedDevice.
    static Aranet4 open(std::shared_ptr<transport::Peripheral> peripheral);

    CurrentReading read_current() const;
    CurrentReadingDetailed read_current_detailed() const;

    // Seconds between environment samples
    uint16_t read_interval() const;

    // Seconds since the last environment sample was taken
    uint16_t read_last_update_age() const;

    // Number of samples held in the device history
    uint16_t read_total_readings() const;

    // Battery level in percent, from the standard Battery service
    uint8_t read_battery_level() const;

    std::string read_name() const;
    std::string read_firmware_version_string() const;
    DeviceInformation read_device_information() const;

    const std::shared_ptr<transport::Peripheral>& peripheral() const { return peripheral_; }

private:
    explicit Aranet4(std::shared_ptr<transport::Peripheral> peripheral)
        : peripheral_(std::move(peripheral)) {}

    std::vector<uint8_t> read_raw(const Characteristic& characteristic) const;
    uint16_t read_u16(const Characteristic& characteristic, const char* what) const;
    std::string read_string(const Characteristic& characteristic, const char* what) const;

    std::shared_ptr<transport::Peripheral> peripheral_;
};

// Turn an advertisement into a connected device: resolves the peripheral on the
// adapter that heard it, connects if needed and opens it.
Aranet4 connect(const DiscoveredDevice& discovered);

} // namespace aranet
