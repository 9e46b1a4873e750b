#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace aranet {

// Sensor calibration state, 2-bit field in the advertisement status byte
enum class CalibrationState : uint8_t {
    NotActive = 0,
    EndRequest = 1,
    InProgress = 2,
    Error = 3,
};

inline std::optional<CalibrationState> calibration_state_from_raw(uint8_t raw) {
    switch (raw) {
        case 0: return CalibrationState::NotActive;
        case 1: return CalibrationState::EndRequest;
        case 2: return CalibrationState::InProgress;
        case 3: return CalibrationState::Error;
        default: return std::nullopt;
    }
}

inline std::string_view to_string(CalibrationState state) {
    switch (state) {
        case CalibrationState::NotActive: return "not_active";
        case CalibrationState::EndRequest: return "end_request";
        case CalibrationState::InProgress: return "in_progress";
        case CalibrationState::Error: return "error";
    }
    return "unknown";
}

// CO2 traffic-light shown on the e-ink display
enum class DisplayStatus : uint8_t {
    Green = 1,
    Yellow = 2,
    Red = 3,
};

inline std::optional<DisplayStatus> display_status_from_raw(uint8_t raw) {
    switch (raw) {
        case 1: return DisplayStatus::Green;
        case 2: return DisplayStatus::Yellow;
        case 3: return DisplayStatus::Red;
        default: return std::nullopt;
    }
}

inline std::string_view to_string(DisplayStatus status) {
    switch (status) {
        case DisplayStatus::Green: return "green";
        case DisplayStatus::Yellow: return "yellow";
        case DisplayStatus::Red: return "red";
    }
    return "unknown";
}

} // namespace aranet
