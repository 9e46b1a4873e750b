#pragma once

#include "../transport/central.hpp"
#include "../types/reading.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aranet::cli {

enum class OutputFormat {
    Text,
    Json,
    Nagios,
};

inline std::string_view to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Json: return "json";
        case OutputFormat::Nagios: return "nagios";
    }
    return "unknown";
}

inline std::optional<OutputFormat> output_format_from_string(std::string_view s) {
    if (s == "text") return OutputFormat::Text;
    if (s == "json") return OutputFormat::Json;
    if (s == "nagios" || s == "monitoring") return OutputFormat::Nagios;
    return std::nullopt;
}

// Wait between outputs when repeating
enum class IntervalMode {
    DeviceDefault,  // the sample interval reported by the device
    Fixed,          // a fixed number of seconds
    Disabled,       // no wait, print every advertisement
};

struct Interval {
    IntervalMode mode = IntervalMode::DeviceDefault;
    uint32_t seconds = 0;
};

// Used when the device interval is requested but no reading was advertised
constexpr uint32_t FALLBACK_INTERVAL_SECONDS = 60;

struct Options {
    OutputFormat format = OutputFormat::Text;
    bool active = false;                // read from the device instead of the advertisement
    bool repeat = false;
    Interval interval{};
    std::optional<std::string> device;  // normalized "AA:BB:CC:DD:EE:FF"
    uint32_t timeout_seconds = 0;       // 0 = wait forever
    int verbosity = 0;
    bool help = false;
    bool version = false;
};

// Parse argv. Returns nullopt and sets `error` on invalid input.
std::optional<Options> parse_args(int argc, const char* const argv[], std::string& error);

std::string usage(std::string_view prog);

// Parse a MAC address string (AA:BB:CC:DD:EE:FF, any case) to bytes
std::optional<std::array<uint8_t, 6>> parse_mac_address(std::string_view address);

// Canonical uppercase form of a MAC address, nullopt if it is not one
std::optional<std::string> normalize_address(std::string_view address);

// True if no device filter is set or the peripheral is the requested one
bool matches_device(const Options& options, const transport::PeripheralId& id);

// Seconds to sleep before the next output, nullopt for no wait
std::optional<uint32_t> wait_seconds(const Interval& interval,
                                     const std::optional<CurrentReadingDetailed>& reading);

// wait_seconds() as a duration, without overflow for large intervals
std::optional<std::chrono::milliseconds> wait_duration(const Interval& interval,
                                                       const std::optional<CurrentReadingDetailed>& reading);

} // namespace aranet::cli
