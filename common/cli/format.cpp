#include "format.hpp"
#include <ArduinoJson.h>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace aranet::cli {

static std::string_view status_label(DisplayStatus status) {
    switch (status) {
        case DisplayStatus::Green: return "Green";
        case DisplayStatus::Yellow: return "Yellow";
        case DisplayStatus::Red: return "Red";
    }
    return "Unknown";
}

// Keep JSON numbers at sensor resolution instead of float noise
static double rounded(float value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(static_cast<double>(value) * scale) / scale;
}

static long percent(float fraction) {
    return std::lround(static_cast<double>(fraction) * 100.0);
}

void print_reading(std::ostream& out, const CurrentReadingDetailed& reading) {
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();

    out << std::fixed;
    out << "Measurement Age: " << reading.age << "/" << reading.interval << "s\n";
    out << "Battery: " << percent(reading.battery) << "%\n";
    if (reading.co2_ppm) {
        out << "CO2: " << *reading.co2_ppm << " PPM\n";
    }
    out << "CO2 Status: " << status_label(reading.status) << "\n";
    if (reading.temperature_c) {
        out << std::setprecision(1) << "Temperature: " << *reading.temperature_f() << "°F ("
            << *reading.temperature_c << "°C)\n";
    }
    out << "Rel. Humidity: " << percent(reading.humidity) << "%\n";
    if (reading.pressure_hpa) {
        out << std::setprecision(3) << "Pressure: " << *reading.pressure_atm() << " atm ("
            << std::setprecision(0) << *reading.pressure_hpa << " hPa)\n";
    }

    out.flags(flags);
    out.precision(precision);
}

void print_text(std::ostream& out, const DiscoveredDevice& device) {
    if (device.current_reading) {
        print_reading(out, *device.current_reading);
    } else {
        out << "<no sample data included in advertisement>\n";
    }
}

std::string to_json(const DiscoveredDevice& device, bool pretty) {
    JsonDocument doc;

    doc["peripheral_id"] = device.peripheral_id;
    doc["adapter"] = device.adapter ? device.adapter->name() : std::string();

    JsonObject manufacturer = doc["manufacturer_data"].to<JsonObject>();
    const auto& m = device.manufacturer_data;
    manufacturer["disconnected"] = m.disconnected;
    manufacturer["calibration_state"] = std::string(to_string(m.calibration_state));
    manufacturer["dfu_active"] = m.dfu_active;
    manufacturer["integrations"] = m.integrations;
    manufacturer["version"] = m.version.to_string();

    if (device.current_reading) {
        const auto& r = *device.current_reading;
        JsonObject reading = doc["current_reading"].to<JsonObject>();

        if (r.co2_ppm) {
            reading["co2_ppm"] = *r.co2_ppm;
        } else {
            reading["co2_ppm"] = nullptr;
        }
        if (r.temperature_c) {
            reading["temperature_c"] = rounded(*r.temperature_c, 2);
        } else {
            reading["temperature_c"] = nullptr;
        }
        if (r.pressure_hpa) {
            reading["pressure_hpa"] = rounded(*r.pressure_hpa, 1);
        } else {
            reading["pressure_hpa"] = nullptr;
        }
        reading["humidity"] = rounded(r.humidity, 2);
        reading["battery"] = rounded(r.battery, 2);
        reading["status"] = std::string(to_string(r.status));
        reading["interval"] = r.interval;
        reading["age"] = r.age;
    } else {
        doc["current_reading"] = nullptr;
    }

    std::string out;
    if (pretty) {
        serializeJsonPretty(doc, out);
    } else {
        serializeJson(doc, out);
    }
    return out;
}

std::string error_json(std::string_view message) {
    JsonDocument doc;
    doc["status"] = "error";
    doc["message"] = std::string(message);

    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string_view to_string(ServiceState state) {
    switch (state) {
        case ServiceState::Ok: return "OK";
        case ServiceState::Warning: return "WARNING";
        case ServiceState::Critical: return "CRITICAL";
        case ServiceState::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

NagiosReport nagios_report(const DiscoveredDevice& device) {
    NagiosReport report;
    std::ostringstream line;

    const auto& reading = device.current_reading;
    report.state = reading ? ServiceState::Ok : ServiceState::Warning;

    line << "ARANET4 " << to_string(report.state) << " - Advertisement from " << device.peripheral_id
         << ", Firmware " << device.manufacturer_data.version.to_string();
    if (reading) {
        line << " (Measurement age " << reading->age << "/" << reading->interval << "s)";
    } else {
        line << " (Measurement not included)";
    }

    if (reading) {
        // 'label'=value[UOM];[warn];[crit];[min];[max]
        line << " | battery=" << percent(reading->battery) << "%;30;10;0;100"
             << " co2_status=" << static_cast<int>(reading->status) << ";2;3;1;3"
             << " humidity=" << percent(reading->humidity) << "%;;;0;100";
        if (reading->co2_ppm) {
            line << " co2_ppm=" << *reading->co2_ppm << "ppm;;;0;";
        }
        line << std::fixed;
        if (auto f = reading->temperature_f()) {
            line << " temperature_f=" << std::setprecision(1) << *f << "F;;;0;";
        }
        if (auto atm = reading->pressure_atm()) {
            line << " pressure_atm=" << std::setprecision(4) << *atm << "atm;;;0;";
        }
    }

    report.line = line.str();
    return report;
}

NagiosReport nagios_error(std::string_view message) {
    NagiosReport report;
    report.state = ServiceState::Critical;
    report.line = "ARANET4 " + std::string(to_string(report.state)) + " - " + std::string(message);
    return report;
}

} // namespace aranet::cli
