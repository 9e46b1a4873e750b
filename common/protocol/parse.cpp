#include "parse.hpp"

namespace aranet::parse {

static uint16_t read_u16_le(std::span<const uint8_t> data, size_t offset) {
    return static_cast<uint16_t>(data[offset] | (static_cast<uint16_t>(data[offset + 1]) << 8));
}

std::optional<ManufacturerData> parse_manufacturer_data(std::span<const uint8_t> data) {
    // Byte 0: bit 0 disconnected, bits 2-3 calibration, bit 4 DFU, bit 5 integrations
    // Bytes 1-3: patch, minor, major
    if (data.size() != MANUFACTURER_DATA_SIZE) {
        return std::nullopt;
    }

    auto calibration = calibration_state_from_raw((data[0] >> 2) & 0x03);
    if (!calibration) {
        return std::nullopt;
    }

    ManufacturerData result;
    result.disconnected = (data[0] & 0x01) != 0;
    result.calibration_state = *calibration;
    result.dfu_active = (data[0] & 0x10) != 0;
    result.integrations = (data[0] & 0x20) != 0;
    result.version.major = data[3];
    result.version.minor = data[2];
    result.version.patch = data[1];
    return result;
}

// Shared by the basic and detailed records, caller checks the length
static std::optional<CurrentReading> parse_reading_fields(std::span<const uint8_t> data) {
    // [co2 u16][temp u16][pressure u16][humidity u8][battery u8][status u8]
    auto status = display_status_from_raw(data[8]);
    if (!status) {
        return std::nullopt;
    }

    CurrentReading reading;

    // A set high bit means the sensor has no valid value (e.g. stale after boot)
    uint16_t co2 = read_u16_le(data, 0);
    if ((co2 >> 15) != 1) {
        reading.co2_ppm = co2;
    }

    uint16_t temperature = read_u16_le(data, 2);
    if (((temperature >> 14) & 1) != 1) {
        reading.temperature_c = static_cast<float>(temperature) * 0.05f;
    }

    uint16_t pressure = read_u16_le(data, 4);
    if ((pressure >> 15) != 1) {
        reading.pressure_hpa = static_cast<float>(pressure) * 0.1f;
    }

    reading.humidity = static_cast<float>(data[6]) / 100.0f;
    reading.battery = static_cast<float>(data[7]) / 100.0f;
    reading.status = *status;
    return reading;
}

std::optional<CurrentReading> parse_current_reading(std::span<const uint8_t> data) {
    if (data.size() != CURRENT_READING_SIZE) {
        return std::nullopt;
    }
    return parse_reading_fields(data);
}

std::optional<CurrentReadingDetailed> parse_current_reading_detailed(std::span<const uint8_t> data) {
    // Basic record followed by [interval u16][age u16]
    if (data.size() != CURRENT_READING_DETAILED_SIZE) {
        return std::nullopt;
    }

    auto basic = parse_reading_fields(data.first(CURRENT_READING_SIZE));
    if (!basic) {
        return std::nullopt;
    }

    CurrentReadingDetailed detailed;
    static_cast<CurrentReading&>(detailed) = *basic;
    detailed.interval = read_u16_le(data, 9);
    detailed.age = read_u16_le(data, 11);
    return detailed;
}

std::optional<Advertisement> parse_advertisement(std::span<const uint8_t> data) {
    // [status block 7][unused 1][detailed reading 13]...
    if (data.size() < MANUFACTURER_DATA_SIZE) {
        return std::nullopt;
    }

    auto manufacturer = parse_manufacturer_data(data.first(MANUFACTURER_DATA_SIZE));
    if (!manufacturer) {
        return std::nullopt;
    }

    Advertisement advertisement{*manufacturer, std::nullopt};

    // Older firmware and devices with Smart Home integrations off send the status block only
    if (data.size() >= ADVERTISED_READING_OFFSET + CURRENT_READING_DETAILED_SIZE) {
        advertisement.current_reading = parse_current_reading_detailed(
            data.subspan(ADVERTISED_READING_OFFSET, CURRENT_READING_DETAILED_SIZE));
    }

    return advertisement;
}

std::optional<uint16_t> parse_u16_le(std::span<const uint8_t> data) {
    if (data.size() != 2) {
        return std::nullopt;
    }
    return read_u16_le(data, 0);
}

std::optional<uint8_t> parse_u8(std::span<const uint8_t> data) {
    if (data.size() != 1) {
        return std::nullopt;
    }
    return data[0];
}

std::optional<std::string> parse_utf8(std::span<const uint8_t> data) {
    size_t pos = 0;
    while (pos < data.size()) {
        uint8_t lead = data[pos];

        size_t length;
        uint32_t code_point;
        if (lead < 0x80) {
            ++pos;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return std::nullopt;
        }

        if (data.size() - pos < length) {
            return std::nullopt;  // Truncated sequence
        }

        for (size_t i = 1; i < length; ++i) {
            uint8_t cont = data[pos + i];
            if ((cont & 0xC0) != 0x80) {
                return std::nullopt;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Reject overlong encodings, UTF-16 surrogates and values past U+10FFFF
        constexpr uint32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < min_for_length[length]) return std::nullopt;
        if (code_point >= 0xD800 && code_point <= 0xDFFF) return std::nullopt;
        if (code_point > 0x10FFFF) return std::nullopt;

        pos += length;
    }

    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace aranet::parse
