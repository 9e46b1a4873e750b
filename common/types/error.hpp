#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace aranet {

enum class ErrorKind {
    NotConnected,       // operation needs an active connection
    UnsupportedDevice,  // Aranet4 service missing (wrong device or firmware < v1.2.0)
    MalformedInput,     // payload length or enumerated byte out of range
    EncodingError,      // string characteristic is not valid UTF-8
    TransportError,     // failure reported by the Bluetooth stack
};

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotConnected: return "not connected";
        case ErrorKind::UnsupportedDevice: return "unsupported device";
        case ErrorKind::MalformedInput: return "malformed input";
        case ErrorKind::EncodingError: return "encoding error";
        case ErrorKind::TransportError: return "transport error";
    }
    return "unknown error";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace aranet
