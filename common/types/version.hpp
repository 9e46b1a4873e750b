#pragma once

#include <cstdint>
#include <string>

namespace aranet {

struct FirmwareVersion {
    uint8_t major = 0;
    uint8_t minor = 0;
    uint8_t patch = 0;

    bool operator==(const FirmwareVersion&) const = default;

    // "vMAJOR.MINOR.PATCH"
    std::string to_string() const {
        return "v" + std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

} // namespace aranet
