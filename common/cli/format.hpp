#pragma once

#include "../discovery/discovery.hpp"
#include "../types/reading.hpp"
#include <ostream>
#include <string>
#include <string_view>

namespace aranet::cli {

// Human readable block, one line per measurement
void print_reading(std::ostream& out, const CurrentReadingDetailed& reading);

// Reading of an advertisement, or a note that it carried none
void print_text(std::ostream& out, const DiscoveredDevice& device);

// Advertisement as a JSON object; `pretty` for indented output
std::string to_json(const DiscoveredDevice& device, bool pretty);

// {"status": "error", "message": ...}
std::string error_json(std::string_view message);

// Monitoring plugin states and exit codes
enum class ServiceState {
    Ok = 0,
    Warning = 1,
    Critical = 2,
    Unknown = 3,
};

std::string_view to_string(ServiceState state);

struct NagiosReport {
    ServiceState state = ServiceState::Unknown;
    std::string line;  // "ARANET4 OK - description | perfdata"

    int exit_code() const { return static_cast<int>(state); }
};

NagiosReport nagios_report(const DiscoveredDevice& device);
NagiosReport nagios_error(std::string_view message);

} // namespace aranet::cli
