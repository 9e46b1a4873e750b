#pragma once

#include <cstdint>
#include <string_view>

namespace aranet::uuids {

// Bluetooth SIG company identifier of SAF Tehnika, the maker of Aranet
constexpr uint16_t MANUFACTURER_ID = 0x0702;

// Services
constexpr const char* AR4_OLD_SERVICE = "f0cd1400-95da-4f4b-9ac8-aa55d312af0c";  // until v1.2.0
constexpr const char* AR4_SERVICE = "0000fce0-0000-1000-8000-00805f9b34fb";      // v1.2.0 and later
constexpr const char* GENERIC_SERVICE = "00001800-0000-1000-8000-00805f9b34fb";
constexpr const char* COMMON_SERVICE = "0000180a-0000-1000-8000-00805f9b34fb";
constexpr const char* BATTERY_SERVICE = "0000180f-0000-1000-8000-00805f9b34fb";

// Aranet service characteristics
constexpr const char* AR4_READ_CURRENT_READINGS = "f0cd1503-95da-4f4b-9ac8-aa55d312af0c";
constexpr const char* AR4_READ_CURRENT_READINGS_DET = "f0cd3001-95da-4f4b-9ac8-aa55d312af0c";
constexpr const char* AR4_READ_INTERVAL = "f0cd2002-95da-4f4b-9ac8-aa55d312af0c";
constexpr const char* AR4_READ_SECONDS_SINCE_UPDATE = "f0cd2004-95da-4f4b-9ac8-aa55d312af0c";
constexpr const char* AR4_READ_TOTAL_READINGS = "f0cd2001-95da-4f4b-9ac8-aa55d312af0c";

// Generic Access
constexpr const char* GENERIC_READ_DEVICE_NAME = "00002a00-0000-1000-8000-00805f9b34fb";

// Device Information
constexpr const char* COMMON_READ_MANUFACTURER_NAME = "00002a29-0000-1000-8000-00805f9b34fb";
constexpr const char* COMMON_READ_MODEL_NUMBER = "00002a24-0000-1000-8000-00805f9b34fb";
constexpr const char* COMMON_READ_SERIAL_NO = "00002a25-0000-1000-8000-00805f9b34fb";
constexpr const char* COMMON_READ_HW_REV = "00002a27-0000-1000-8000-00805f9b34fb";
constexpr const char* COMMON_READ_FACTORY_SW_REV = "00002a28-0000-1000-8000-00805f9b34fb";
constexpr const char* COMMON_READ_SW_REV = "00002a26-0000-1000-8000-00805f9b34fb";

// Battery
constexpr const char* BATTERY_READ = "00002a19-0000-1000-8000-00805f9b34fb";

// Case-insensitive compare, BlueZ reports lowercase but other stacks may not
inline bool equal(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

} // namespace aranet::uuids

namespace aranet {

// A GATT characteristic and the service it lives in
struct Characteristic {
    const char* uuid;
    const char* service_uuid;
};

namespace characteristics {
    constexpr Characteristic CURRENT_READINGS{uuids::AR4_READ_CURRENT_READINGS, uuids::AR4_SERVICE};
    constexpr Characteristic CURRENT_READINGS_DET{uuids::AR4_READ_CURRENT_READINGS_DET, uuids::AR4_SERVICE};
    constexpr Characteristic INTERVAL{uuids::AR4_READ_INTERVAL, uuids::AR4_SERVICE};
    constexpr Characteristic SECONDS_SINCE_UPDATE{uuids::AR4_READ_SECONDS_SINCE_UPDATE, uuids::AR4_SERVICE};
    constexpr Characteristic TOTAL_READINGS{uuids::AR4_READ_TOTAL_READINGS, uuids::AR4_SERVICE};

    constexpr Characteristic DEVICE_NAME{uuids::GENERIC_READ_DEVICE_NAME, uuids::GENERIC_SERVICE};

    constexpr Characteristic MANUFACTURER_NAME{uuids::COMMON_READ_MANUFACTURER_NAME, uuids::COMMON_SERVICE};
    constexpr Characteristic MODEL_NUMBER{uuids::COMMON_READ_MODEL_NUMBER, uuids::COMMON_SERVICE};
    constexpr Characteristic SERIAL_NO{uuids::COMMON_READ_SERIAL_NO, uuids::COMMON_SERVICE};
    constexpr Characteristic HW_REV{uuids::COMMON_READ_HW_REV, uuids::COMMON_SERVICE};
    constexpr Characteristic FACTORY_SW_REV{uuids::COMMON_READ_FACTORY_SW_REV, uuids::COMMON_SERVICE};
    constexpr Characteristic SW_REV{uuids::COMMON_READ_SW_REV, uuids::COMMON_SERVICE};

    constexpr Characteristic BATTERY_LEVEL{uuids::BATTERY_READ, uuids::BATTERY_SERVICE};
}

} // namespace aranet
