#pragma once

#include "../transport/central.hpp"
#include "../types/reading.hpp"
#include "channel.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace aranet {

// One Aranet4 advertisement as heard by one adapter. The same device shows
// up again for every advertisement it sends.
struct DiscoveredDevice {
    std::shared_ptr<transport::Adapter> adapter;
    transport::PeripheralId peripheral_id;
    ManufacturerData manufacturer_data;
    std::optional<CurrentReadingDetailed> current_reading;
};

// Decode one central event. Returns nullopt for other event kinds, other
// manufacturers and advertisements whose status block is malformed.
std::optional<DiscoveredDevice> inspect_event(const std::shared_ptr<transport::Adapter>& adapter,
                                              const transport::CentralEvent& event);

// Merged stream of Aranet4 advertisements from every adapter.
//
// Each adapter is drained by its own worker thread; the consumer sees events
// in arrival order. Stopping (explicitly or by destroying the stream) joins
// the workers and stops scanning on every adapter.
class DiscoveryStream {
    // Only discover() can create a stream
    struct Key {
        explicit Key() = default;
    };

    struct Source {
        std::shared_ptr<transport::Adapter> adapter;
        std::unique_ptr<transport::EventStream> events;
    };

public:
    DiscoveryStream(Key, std::vector<Source> sources);
    ~DiscoveryStream();

    DiscoveryStream(const DiscoveryStream&) = delete;
    DiscoveryStream& operator=(const DiscoveryStream&) = delete;

    // Blocks until the next advertisement. Returns nullopt only once every
    // adapter's event source has ended (or there were no adapters).
    std::optional<DiscoveredDevice> next();

    // Waits at most `timeout`. nullopt with finished() == false is a timeout.
    std::optional<DiscoveredDevice> next_for(std::chrono::milliseconds timeout);

    // Drop advertisements that queued up while the consumer was busy
    size_t discard_pending();

    bool finished() const;

    // Number of adapters that are scanning
    size_t adapter_count() const { return sources_.size(); }

    void stop();

private:
    friend std::unique_ptr<DiscoveryStream> discover(transport::Central& central);

    void start();
    void pump(std::stop_token stop, size_t index);

    std::vector<Source> sources_;
    Channel<DiscoveredDevice> channel_;
    std::vector<std::jthread> workers_;
    std::atomic<bool> stopped_{false};
};

// Start scanning on every adapter for the Aranet4 service and listen for
// advertisements.
//
// Adapters whose scan or subscription fails are logged and skipped. Throws
// aranet::Error (TransportError) if adapters exist but none could be set up,
// or if the adapter list itself cannot be read.
std::unique_ptr<DiscoveryStream> discover(transport::Central& central);

} // namespace aranet
