#include "discovery.hpp"
#include "../log.hpp"
#include "../protocol/parse.hpp"
#include "../protocol/uuids.hpp"
#include "../types/error.hpp"

namespace aranet {

// How long a worker blocks on its adapter before re-checking for stop
constexpr std::chrono::milliseconds POLL_INTERVAL{100};

std::optional<DiscoveredDevice> inspect_event(const std::shared_ptr<transport::Adapter>& adapter,
                                              const transport::CentralEvent& event) {
    // Only manufacturer data is used for now; service data and connection
    // events are not needed to find a sensor
    if (event.kind != transport::CentralEventKind::ManufacturerDataAdvertisement) {
        return std::nullopt;
    }

    auto it = event.manufacturer_data.find(uuids::MANUFACTURER_ID);
    if (it == event.manufacturer_data.end()) {
        return std::nullopt;
    }

    auto advertisement = parse::parse_advertisement(it->second);
    if (!advertisement) {
        log::warn() << "discovery: malformed advertisement from " << event.id
                    << " (" << it->second.size() << " bytes), skipping" << std::endl;
        return std::nullopt;
    }

    DiscoveredDevice found;
    found.adapter = adapter;
    found.peripheral_id = event.id;
    found.manufacturer_data = advertisement->manufacturer_data;
    found.current_reading = advertisement->current_reading;
    return found;
}

DiscoveryStream::DiscoveryStream(Key, std::vector<Source> sources)
    : sources_(std::move(sources)), channel_(sources_.size()) {}

DiscoveryStream::~DiscoveryStream() {
    stop();
}

void DiscoveryStream::start() {
    workers_.reserve(sources_.size());
    for (size_t i = 0; i < sources_.size(); ++i) {
        workers_.emplace_back([this, i](std::stop_token stop) { pump(stop, i); });
    }
    log::debug() << "discovery: listening on " << sources_.size() << " adapters" << std::endl;
}

void DiscoveryStream::pump(std::stop_token stop, size_t index) {
    auto& source = sources_[index];
    std::string adapter_name = "adapter " + std::to_string(index);

    try {
        adapter_name = source.adapter->name();

        while (!stop.stop_requested()) {
            auto event = source.events->next(POLL_INTERVAL);
            if (!event) {
                if (source.events->ended()) {
                    log::debug() << "discovery: " << adapter_name << " event source ended" << std::endl;
                    break;
                }
                continue;
            }

            log::trace() << "discovery: " << adapter_name << " event " << static_cast<int>(event->kind)
                         << " from " << event->id << std::endl;

            if (auto found = inspect_event(source.adapter, *event)) {
                channel_.push(std::move(*found));
            }
        }
    } catch (const Error& e) {
        log::error() << "discovery: " << adapter_name << " event stream failed: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        log::error() << "discovery: " << adapter_name << " worker failed: " << e.what() << std::endl;
    }

    // The other adapters keep delivering
    channel_.producer_done();
}

std::optional<DiscoveredDevice> DiscoveryStream::next() {
    return channel_.pop();
}

std::optional<DiscoveredDevice> DiscoveryStream::next_for(std::chrono::milliseconds timeout) {
    return channel_.pop_for(timeout);
}

size_t DiscoveryStream::discard_pending() {
    return channel_.clear();
}

bool DiscoveryStream::finished() const {
    return channel_.drained();
}

void DiscoveryStream::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    // jthread requests stop and joins on destruction
    workers_.clear();

    for (auto& source : sources_) {
        source.events.reset();
        try {
            source.adapter->stop_scan();
            log::debug() << "discovery: " << source.adapter->name() << " stopped scanning" << std::endl;
        } catch (const Error& e) {
            log::warn() << "discovery: " << source.adapter->name() << " failed to stop scanning: "
                        << e.what() << std::endl;
        }
    }
}

std::unique_ptr<DiscoveryStream> discover(transport::Central& central) {
    auto adapters = central.adapters();
    log::debug() << "discovery: found " << adapters.size() << " BTLE adapters" << std::endl;

    transport::ScanFilter filter;
    filter.services.push_back(uuids::AR4_SERVICE);

    std::vector<DiscoveryStream::Source> sources;
    for (const auto& adapter : adapters) {
        const std::string name = adapter->name();
        bool scanning = false;

        try {
            adapter->start_scan(filter);
            scanning = true;
            log::debug() << "discovery: " << name << " started scanning" << std::endl;

            auto events = adapter->events();
            if (!events) {
                throw Error(ErrorKind::TransportError, "adapter returned no event stream");
            }
            log::debug() << "discovery: " << name << " listening" << std::endl;

            sources.push_back({adapter, std::move(events)});
        } catch (const Error& e) {
            log::error() << "discovery: " << name << " setup failed: " << e.what() << std::endl;
            if (scanning) {
                try {
                    adapter->stop_scan();
                } catch (const Error& stop_error) {
                    log::warn() << "discovery: " << name << " failed to stop scanning: "
                                << stop_error.what() << std::endl;
                }
            }
        }
    }

    if (!adapters.empty() && sources.empty()) {
        throw Error(ErrorKind::TransportError,
                    "unable to start scanning on any of " + std::to_string(adapters.size()) +
                    " Bluetooth adapters");
    }

    auto stream = std::make_unique<DiscoveryStream>(DiscoveryStream::Key{}, std::move(sources));
    stream->start();
    return stream;
}

} // namespace aranet
