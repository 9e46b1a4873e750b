#include "options.hpp"
#include <charconv>
#include <sstream>

namespace aranet::cli {

static std::optional<uint32_t> parse_seconds(std::string_view s) {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

static std::optional<Interval> parse_interval(std::string_view s) {
    if (s == "device") return Interval{IntervalMode::DeviceDefault, 0};
    if (s == "off" || s == "none") return Interval{IntervalMode::Disabled, 0};

    auto seconds = parse_seconds(s);
    if (!seconds) return std::nullopt;

    // 0 keeps the historical meaning "use the interval from the device"
    if (*seconds == 0) return Interval{IntervalMode::DeviceDefault, 0};
    return Interval{IntervalMode::Fixed, *seconds};
}

std::optional<Options> parse_args(int argc, const char* const argv[], std::string& error) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Long options accept --name=value as well as --name value
        std::optional<std::string_view> inline_value;
        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto take_value = [&]() -> std::optional<std::string_view> {
            if (inline_value) return inline_value;
            if (i + 1 >= argc) {
                error = "missing value for " + std::string(arg);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        auto flag = [&](bool& target) -> bool {
            if (inline_value) {
                error = std::string(arg) + " does not take a value";
                return false;
            }
            target = true;
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            if (!flag(options.help)) return std::nullopt;
        } else if (arg == "--version") {
            if (!flag(options.version)) return std::nullopt;
        } else if (arg == "-a" || arg == "--active") {
            if (!flag(options.active)) return std::nullopt;
        } else if (arg == "-r" || arg == "--repeat") {
            if (!flag(options.repeat)) return std::nullopt;
        } else if (arg == "-f" || arg == "--format") {
            auto value = take_value();
            if (!value) return std::nullopt;
            auto format = output_format_from_string(*value);
            if (!format) {
                error = "invalid format: " + std::string(*value) + " (expected text, json or nagios)";
                return std::nullopt;
            }
            options.format = *format;
        } else if (arg == "-i" || arg == "--interval") {
            auto value = take_value();
            if (!value) return std::nullopt;
            auto interval = parse_interval(*value);
            if (!interval) {
                error = "invalid interval: " + std::string(*value) + " (expected seconds, device or off)";
                return std::nullopt;
            }
            options.interval = *interval;
        } else if (arg == "-d" || arg == "--device") {
            auto value = take_value();
            if (!value) return std::nullopt;
            auto address = normalize_address(*value);
            if (!address) {
                error = "invalid device address: " + std::string(*value);
                return std::nullopt;
            }
            options.device = std::move(*address);
        } else if (arg == "-t" || arg == "--timeout") {
            auto value = take_value();
            if (!value) return std::nullopt;
            auto seconds = parse_seconds(*value);
            if (!seconds) {
                error = "invalid timeout: " + std::string(*value);
                return std::nullopt;
            }
            options.timeout_seconds = *seconds;
        } else if (arg == "--verbose") {
            if (inline_value) {
                error = "--verbose does not take a value";
                return std::nullopt;
            }
            ++options.verbosity;
        } else if (arg.size() >= 2 && arg[0] == '-' && arg.find_first_not_of('v', 1) == std::string_view::npos) {
            // -v, -vv, -vvv
            options.verbosity += static_cast<int>(arg.size() - 1);
        } else {
            error = "unknown argument: " + std::string(arg);
            return std::nullopt;
        }
    }

    return options;
}

std::string usage(std::string_view prog) {
    std::ostringstream out;
    out << "Usage: " << prog << " [options]\n"
        << "\n"
        << "Read an Aranet4 CO2 monitor over Bluetooth LE.\n"
        << "\n"
        << "Options:\n"
        << "  -f, --format <fmt>      Output format: text, json, nagios (default text)\n"
        << "                          With --repeat, json prints one object per line\n"
        << "  -a, --active            Connect and read the sensor instead of using the advertisement\n"
        << "  -r, --repeat            Keep printing samples instead of exiting after the first\n"
        << "                          (ignored by --format=nagios)\n"
        << "  -i, --interval <secs>   Wait between samples when repeating; 0 or 'device' uses the\n"
        << "                          device interval, 'off' prints every advertisement\n"
        << "  -d, --device <addr>     Only accept this device (AA:BB:CC:DD:EE:FF)\n"
        << "  -t, --timeout <secs>    Give up after waiting this long for a sample (0 = never)\n"
        << "  -v, --verbose           More logging, repeat for more (see also ARANET_LOG)\n"
        << "  -h, --help              Show this help\n"
        << "      --version           Show the version\n";
    return out.str();
}

std::optional<std::array<uint8_t, 6>> parse_mac_address(std::string_view address) {
    std::array<uint8_t, 6> result{};

    // Expect format: AA:BB:CC:DD:EE:FF
    if (address.size() != 17) {
        return std::nullopt;
    }

    size_t byte_idx = 0;
    for (size_t i = 0; i < address.size() && byte_idx < 6; i += 3) {
        if (i + 2 < address.size() && address[i + 2] != ':') {
            return std::nullopt;
        }
        auto part = address.substr(i, 2);
        uint8_t value;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value, 16);
        if (ec != std::errc{} || ptr != part.data() + part.size()) {
            return std::nullopt;
        }
        result[byte_idx++] = value;
    }

    return result;
}

std::optional<std::string> normalize_address(std::string_view address) {
    auto bytes = parse_mac_address(address);
    if (!bytes) {
        return std::nullopt;
    }

    constexpr char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(17);
    for (size_t i = 0; i < bytes->size(); ++i) {
        if (i > 0) result.push_back(':');
        result.push_back(hex[(*bytes)[i] >> 4]);
        result.push_back(hex[(*bytes)[i] & 0x0F]);
    }
    return result;
}

bool matches_device(const Options& options, const transport::PeripheralId& id) {
    if (!options.device) {
        return true;
    }
    auto normalized = normalize_address(id);
    return normalized && *normalized == *options.device;
}

std::optional<uint32_t> wait_seconds(const Interval& interval,
                                     const std::optional<CurrentReadingDetailed>& reading) {
    switch (interval.mode) {
        case IntervalMode::Disabled:
            return std::nullopt;
        case IntervalMode::Fixed:
            return interval.seconds;
        case IntervalMode::DeviceDefault:
            if (reading && reading->interval > 0) {
                return reading->interval;
            }
            return FALLBACK_INTERVAL_SECONDS;
    }
    return std::nullopt;
}

std::optional<std::chrono::milliseconds> wait_duration(const Interval& interval,
                                                       const std::optional<CurrentReadingDetailed>& reading) {
    auto seconds = wait_seconds(interval, reading);
    if (!seconds) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(*seconds));
}

} // namespace aranet::cli
