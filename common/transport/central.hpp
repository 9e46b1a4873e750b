#pragma once

#include "../protocol/uuids.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aranet::transport {

// Stack-specific peripheral identity (a MAC address on BlueZ)
using PeripheralId = std::string;

enum class CentralEventKind {
    DeviceDiscovered,
    DeviceUpdated,
    DeviceConnected,
    DeviceDisconnected,
    ManufacturerDataAdvertisement,
    ServiceDataAdvertisement,
    ServicesAdvertisement,
};

// One event reported by an adapter. Only the fields matching `kind` are filled.
struct CentralEvent {
    CentralEventKind kind = CentralEventKind::DeviceUpdated;
    PeripheralId id;

    // ManufacturerDataAdvertisement: company ID -> payload
    std::map<uint16_t, std::vector<uint8_t>> manufacturer_data;

    // ServiceDataAdvertisement: service UUID -> payload
    std::map<std::string, std::vector<uint8_t>> service_data;

    // ServicesAdvertisement
    std::vector<std::string> services;
};

struct ScanFilter {
    std::vector<std::string> services;
};

// Live sequence of events from one adapter.
// All implementations must be safe to drain from a thread other than the one
// that created them.
class EventStream {
public:
    virtual ~EventStream() = default;

    // Wait up to `timeout` for the next event. Returns nullopt on timeout or
    // once the source has ended (see ended()).
    virtual std::optional<CentralEvent> next(std::chrono::milliseconds timeout) = 0;

    // True once the source is gone for good (adapter removed, bus closed)
    virtual bool ended() const = 0;
};

// Errors from every method below are reported as aranet::Error with
// ErrorKind::TransportError unless stated otherwise.
class Peripheral {
public:
    virtual ~Peripheral() = default;

    virtual PeripheralId id() const = 0;
    virtual bool is_connected() = 0;
    virtual void connect() = 0;

    // Enumerate GATT services, blocks until the stack has resolved them
    virtual void discover_services() = 0;

    // Service UUIDs found so far, empty before discovery
    virtual std::vector<std::string> services() = 0;

    virtual std::vector<uint8_t> read(const Characteristic& characteristic) = 0;
};

class Adapter {
public:
    virtual ~Adapter() = default;

    // Human readable adapter name, e.g. "hci0"
    virtual std::string name() const = 0;

    virtual void start_scan(const ScanFilter& filter) = 0;
    virtual void stop_scan() = 0;

    // Subscribe to this adapter's events
    virtual std::unique_ptr<EventStream> events() = 0;

    // Handle for a peripheral this adapter has seen
    virtual std::shared_ptr<Peripheral> peripheral(const PeripheralId& id) = 0;
};

class Central {
public:
    virtual ~Central() = default;

    virtual std::vector<std::shared_ptr<Adapter>> adapters() = 0;
};

} // namespace aranet::transport
