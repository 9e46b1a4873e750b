#include "bluez.hpp"

#include <cli/format.hpp>
#include <cli/options.hpp>
#include <device/aranet4.hpp>
#include <discovery/discovery.hpp>
#include <log.hpp>
#include <types/error.hpp>

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>

#ifndef ARANET_VERSION
#define ARANET_VERSION "unknown"
#endif

using namespace aranet;

static std::atomic<bool> g_running{true};

// Signal handler
static void signal_handler(int) {
    g_running = false;
}

static void configure_logging(int verbosity) {
    if (const char* env = std::getenv("ARANET_LOG")) {
        if (auto level = log::level_from_string(env)) {
            log::set_level(*level);
        } else {
            log::warn() << "aranet: ignoring unknown ARANET_LOG level '" << env << "'" << std::endl;
        }
    }

    int level = static_cast<int>(log::level()) + verbosity;
    if (level > static_cast<int>(log::Level::Trace)) {
        level = static_cast<int>(log::Level::Trace);
    }
    log::set_level(static_cast<log::Level>(level));
}

// Report a fatal error in the selected format, returns the exit code
static int report_error(const cli::Options& options, const std::string& message) {
    switch (options.format) {
        case cli::OutputFormat::Text:
            std::cerr << message << std::endl;
            return 1;
        case cli::OutputFormat::Json:
            std::cerr << cli::error_json(message) << std::endl;
            return 1;
        case cli::OutputFormat::Nagios: {
            auto report = cli::nagios_error(message);
            std::cout << report.line << std::endl;
            return report.exit_code();
        }
    }
    return 1;
}

enum class WaitResult {
    Found,
    TimedOut,
    Interrupted,
    Ended,
};

// Wait for the next advertisement from the requested device
static WaitResult next_device(DiscoveryStream& stream, const cli::Options& options,
                              std::optional<DiscoveredDevice>& found) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(options.timeout_seconds);

    while (g_running) {
        if (options.timeout_seconds > 0 && clock::now() >= deadline) {
            return WaitResult::TimedOut;
        }

        auto device = stream.next_for(std::chrono::milliseconds(100));
        if (!device) {
            if (stream.finished()) {
                return WaitResult::Ended;
            }
            continue;
        }

        if (!cli::matches_device(options, device->peripheral_id)) {
            log::trace() << "aranet: skipping " << device->peripheral_id << std::endl;
            continue;
        }

        log::info() << "aranet: received advertisement from " << device->peripheral_id
                    << " firmware " << device->manufacturer_data.version.to_string()
                    << " (contains reading: " << (device->current_reading ? "yes" : "no") << ")" << std::endl;

        found = std::move(device);
        return WaitResult::Found;
    }
    return WaitResult::Interrupted;
}

// Sleep in short steps so a signal ends the wait
static void sleep_interruptible(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (g_running && std::chrono::steady_clock::now() < deadline) {
        usleep(100000);  // 100ms
    }
}

static int run(const cli::Options& options) {
    bluez::Central central;

    log::info() << "aranet: discovering BTLE adapters" << std::endl;
    auto stream = discover(central);

    if (stream->adapter_count() == 0) {
        return report_error(options, "Unable to discover devices. No Bluetooth adapters present.");
    }

    log::info() << "aranet: looking for Aranet4" << std::endl;

    bool first = true;
    while (g_running) {
        std::optional<DiscoveredDevice> device;
        switch (next_device(*stream, options, device)) {
            case WaitResult::Found:
                break;
            case WaitResult::Interrupted:
                return 0;
            case WaitResult::TimedOut:
                return report_error(options, "Timed out waiting for an Aranet4 advertisement.");
            case WaitResult::Ended:
                return report_error(options, "Bluetooth adapters stopped reporting devices.");
        }

        if (options.active) {
            auto sensor = aranet::connect(*device);
            device->current_reading = sensor.read_current_detailed();
        }

        switch (options.format) {
            case cli::OutputFormat::Text:
                if (!first) std::cout << "\n";
                cli::print_text(std::cout, *device);
                break;
            case cli::OutputFormat::Json:
                std::cout << cli::to_json(*device, !options.repeat) << std::endl;
                break;
            case cli::OutputFormat::Nagios: {
                auto report = cli::nagios_report(*device);
                std::cout << report.line << std::endl;
                return report.exit_code();
            }
        }
        std::cout.flush();
        first = false;

        if (!options.repeat) {
            break;
        }

        if (auto wait = cli::wait_duration(options.interval, device->current_reading)) {
            log::debug() << "aranet: waiting " << wait->count() << "ms for the next sample" << std::endl;
            sleep_interruptible(*wait);

            size_t dropped = stream->discard_pending();
            log::debug() << "aranet: dropped " << dropped << " stale advertisements" << std::endl;
        }
    }

    return 0;
}

int main(int argc, char* argv[]) {
    std::string error;
    auto options = cli::parse_args(argc, argv, error);
    if (!options) {
        std::cerr << argv[0] << ": " << error << "\n\n" << cli::usage(argv[0]);
        return 2;
    }

    if (options->help) {
        std::cout << cli::usage(argv[0]);
        return 0;
    }
    if (options->version) {
        std::cout << "aranet " << ARANET_VERSION << std::endl;
        return 0;
    }

    configure_logging(options->verbosity);

    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        return run(*options);
    } catch (const Error& e) {
        log::debug() << "aranet: " << to_string(e.kind()) << std::endl;
        return report_error(*options, e.what());
    }
}
