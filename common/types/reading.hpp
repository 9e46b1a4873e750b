#pragma once

#include "enums.hpp"
#include "units.hpp"
#include "version.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace aranet {

// Status block at the start of every advertisement
struct ManufacturerData {
    bool disconnected = false;
    CalibrationState calibration_state = CalibrationState::NotActive;
    bool dfu_active = false;
    bool integrations = false;
    FirmwareVersion version{};

    bool operator==(const ManufacturerData&) const = default;
};

struct CurrentReading {
    std::optional<uint16_t> co2_ppm;      // ppm
    std::optional<float> temperature_c;   // celsius
    std::optional<float> pressure_hpa;    // hPa
    float humidity = 0.0f;                // 0-1
    float battery = 0.0f;                 // 0-1
    DisplayStatus status = DisplayStatus::Green;

    bool operator==(const CurrentReading&) const = default;

    std::optional<float> temperature_f() const { return temperature_c_to_f(temperature_c); }
    std::optional<float> pressure_atm() const { return pressure_hpa_to_atm(pressure_hpa); }
};

struct CurrentReadingDetailed : CurrentReading {
    uint16_t interval = 0;  // seconds between samples
    uint16_t age = 0;       // seconds since this sample was taken

    bool operator==(const CurrentReadingDetailed&) const = default;
};

// Standard Device Information service (0x180A)
struct DeviceInformation {
    std::string manufacturer;
    std::string model_number;
    std::string serial_number;
    std::string hardware_revision;
    std::string software_revision;
    std::string factory_software_revision;
};

} // namespace aranet
