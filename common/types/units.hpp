#pragma once

#include <optional>

namespace aranet {

constexpr float STANDARD_ATMOSPHERE_HPA = 1013.25f;

constexpr float temperature_c_to_f(float c) { return c * 1.8f + 32.0f; }
constexpr float temperature_f_to_c(float f) { return (f - 32.0f) / 1.8f; }

constexpr float pressure_hpa_to_atm(float hpa) { return hpa / STANDARD_ATMOSPHERE_HPA; }
constexpr float pressure_atm_to_hpa(float atm) { return atm * STANDARD_ATMOSPHERE_HPA; }

// Absent sensor values stay absent through a conversion
inline std::optional<float> temperature_c_to_f(std::optional<float> c) {
    if (!c) return std::nullopt;
    return temperature_c_to_f(*c);
}

inline std::optional<float> temperature_f_to_c(std::optional<float> f) {
    if (!f) return std::nullopt;
    return temperature_f_to_c(*f);
}

inline std::optional<float> pressure_hpa_to_atm(std::optional<float> hpa) {
    if (!hpa) return std::nullopt;
    return pressure_hpa_to_atm(*hpa);
}

inline std::optional<float> pressure_atm_to_hpa(std::optional<float> atm) {
    if (!atm) return std::nullopt;
    return pressure_atm_to_hpa(*atm);
}

} // namespace aranet
