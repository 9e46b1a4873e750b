#pragma once

#include "../types/reading.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace aranet::parse {

constexpr size_t MANUFACTURER_DATA_SIZE = 7;
constexpr size_t CURRENT_READING_SIZE = 9;
constexpr size_t CURRENT_READING_DETAILED_SIZE = 13;

// Offset of the detailed reading inside the advertisement payload
constexpr size_t ADVERTISED_READING_OFFSET = 8;

// All decoders return nullopt when the payload is malformed (wrong length,
// undefined enumerated value). They never read past the end of the input.

// Advertisement status block: 7 bytes
std::optional<ManufacturerData> parse_manufacturer_data(std::span<const uint8_t> data);

// Current readings characteristic: 9 bytes
std::optional<CurrentReading> parse_current_reading(std::span<const uint8_t> data);

// Current readings (detailed) characteristic: 13 bytes
std::optional<CurrentReadingDetailed> parse_current_reading_detailed(std::span<const uint8_t> data);

// Full payload advertised under MANUFACTURER_ID. The status block is
// mandatory; the embedded reading is optional and dropped if malformed.
struct Advertisement {
    ManufacturerData manufacturer_data;
    std::optional<CurrentReadingDetailed> current_reading;
};
std::optional<Advertisement> parse_advertisement(std::span<const uint8_t> data);

// Exactly 2 bytes, little-endian
std::optional<uint16_t> parse_u16_le(std::span<const uint8_t> data);

// Exactly 1 byte
std::optional<uint8_t> parse_u8(std::span<const uint8_t> data);

// Returns nullopt if the bytes are not valid UTF-8
std::optional<std::string> parse_utf8(std::span<const uint8_t> data);

} // namespace aranet::parse
