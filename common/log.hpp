#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string_view>

// Leveled logging to stderr. Callers prefix their component name:
//   log::debug() << "bluez: started discovery on " << path << std::endl;

namespace aranet::log {

enum class Level : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
    Trace = 4,
};

inline std::atomic<Level> g_level{Level::Warn};

inline void set_level(Level level) { g_level = level; }
inline Level level() { return g_level; }
inline bool enabled(Level level) { return level <= g_level.load(); }

inline std::optional<Level> level_from_string(std::string_view s) {
    if (s == "error") return Level::Error;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "info") return Level::Info;
    if (s == "debug") return Level::Debug;
    if (s == "trace") return Level::Trace;
    return std::nullopt;
}

inline std::ostream& stream(Level level) {
    // Per-thread sink, a stream without a buffer discards everything written to it
    thread_local std::ostream null_stream(nullptr);
    return enabled(level) ? std::cerr : null_stream;
}

inline std::ostream& error() { return stream(Level::Error); }
inline std::ostream& warn() { return stream(Level::Warn); }
inline std::ostream& info() { return stream(Level::Info); }
inline std::ostream& debug() { return stream(Level::Debug); }
inline std::ostream& trace() { return stream(Level::Trace); }

} // namespace aranet::log
