/*
 * In-memory transport for tests: adapters with scripted events and
 * peripherals with canned characteristic values
 */

#pragma once

#include "transport/central.hpp"
#include "types/error.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fake {

using aranet::transport::CentralEvent;
using aranet::transport::CentralEventKind;

// Events shared between an adapter (test side) and its stream (worker side)
class EventSource {
public:
    void emit(CentralEvent event) {
        {
            std::lock_guard lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_all();
    }

    void end() {
        {
            std::lock_guard lock(mutex_);
            ended_ = true;
        }
        cv_.notify_all();
    }

    std::optional<CentralEvent> next(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !events_.empty() || ended_; });
        if (events_.empty()) return std::nullopt;
        CentralEvent event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    bool ended() const {
        std::lock_guard lock(mutex_);
        return ended_ && events_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<CentralEvent> events_;
    bool ended_ = false;
};

class EventStream : public aranet::transport::EventStream {
public:
    explicit EventStream(std::shared_ptr<EventSource> source) : source_(std::move(source)) {}

    std::optional<CentralEvent> next(std::chrono::milliseconds timeout) override {
        if (fail_next) {
            throw aranet::Error(aranet::ErrorKind::TransportError, "event stream broke");
        }
        if (crash_next) {
            throw std::runtime_error("event stream crashed");
        }
        return source_->next(timeout);
    }

    // Make the next call to next() throw aranet::Error / std::runtime_error
    std::atomic<bool> fail_next{false};
    std::atomic<bool> crash_next{false};
    bool ended() const override { return source_->ended(); }

private:
    std::shared_ptr<EventSource> source_;
};

class Peripheral : public aranet::transport::Peripheral {
public:
    explicit Peripheral(std::string id) : id_(std::move(id)) {}

    aranet::transport::PeripheralId id() const override { return id_; }
    bool is_connected() override { return connected; }

    void connect() override {
        ++connect_calls;
        connected = true;
    }

    void discover_services() override {
        ++discover_calls;
        services_ = services_after_discovery;
    }

    std::vector<std::string> services() override { return services_; }

    std::vector<uint8_t> read(const aranet::Characteristic& characteristic) override {
        ++read_calls;
        auto it = values.find(characteristic.uuid);
        if (it == values.end()) {
            throw aranet::Error(aranet::ErrorKind::TransportError,
                                std::string("no value for ") + characteristic.uuid);
        }
        return it->second;
    }

    void set_services(std::vector<std::string> services) { services_ = std::move(services); }

    bool connected = true;
    std::vector<std::string> services_after_discovery;
    std::map<std::string, std::vector<uint8_t>> values;  // characteristic UUID -> value

    int connect_calls = 0;
    int discover_calls = 0;
    int read_calls = 0;

private:
    std::string id_;
    std::vector<std::string> services_;
};

class Adapter : public aranet::transport::Adapter {
public:
    explicit Adapter(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }

    void start_scan(const aranet::transport::ScanFilter& filter) override {
        ++start_scan_calls;
        if (fail_start_scan) {
            throw aranet::Error(aranet::ErrorKind::TransportError, name_ + " refused to scan");
        }
        std::lock_guard lock(mutex_);
        last_filter_ = filter;
        scanning = true;
    }

    void stop_scan() override {
        ++stop_scan_calls;
        scanning = false;
    }

    std::unique_ptr<aranet::transport::EventStream> events() override {
        if (fail_events) {
            throw aranet::Error(aranet::ErrorKind::TransportError, name_ + " has no event stream");
        }
        auto stream = std::make_unique<EventStream>(source_);
        std::lock_guard lock(mutex_);
        last_stream_ = stream.get();
        return stream;
    }

    // Stream handed out by the last events() call, owned by its consumer
    EventStream* last_stream() const {
        std::lock_guard lock(mutex_);
        return last_stream_;
    }

    std::shared_ptr<aranet::transport::Peripheral> peripheral(const aranet::transport::PeripheralId& id) override {
        std::lock_guard lock(mutex_);
        auto it = peripherals_.find(id);
        return it == peripherals_.end() ? nullptr : it->second;
    }

    void add_peripheral(std::shared_ptr<Peripheral> peripheral) {
        std::lock_guard lock(mutex_);
        peripherals_[peripheral->id()] = std::move(peripheral);
    }

    aranet::transport::ScanFilter last_filter() const {
        std::lock_guard lock(mutex_);
        return last_filter_;
    }

    void emit(CentralEvent event) { source_->emit(std::move(event)); }
    void end() { source_->end(); }

    // Manufacturer data advertisement from `id`
    void advertise(const std::string& id, uint16_t manufacturer_id, std::vector<uint8_t> payload) {
        CentralEvent event;
        event.kind = CentralEventKind::ManufacturerDataAdvertisement;
        event.id = id;
        event.manufacturer_data[manufacturer_id] = std::move(payload);
        emit(std::move(event));
    }

    std::atomic<bool> scanning{false};
    std::atomic<int> start_scan_calls{0};
    std::atomic<int> stop_scan_calls{0};
    bool fail_start_scan = false;
    bool fail_events = false;

private:
    std::string name_;
    mutable std::mutex mutex_;
    aranet::transport::ScanFilter last_filter_;
    std::map<std::string, std::shared_ptr<Peripheral>> peripherals_;
    std::shared_ptr<EventSource> source_ = std::make_shared<EventSource>();
    EventStream* last_stream_ = nullptr;
};

class Central : public aranet::transport::Central {
public:
    std::vector<std::shared_ptr<aranet::transport::Adapter>> adapters() override {
        if (fail_adapters) {
            throw aranet::Error(aranet::ErrorKind::TransportError, "bus unavailable");
        }
        return std::vector<std::shared_ptr<aranet::transport::Adapter>>(adapters_.begin(), adapters_.end());
    }

    std::shared_ptr<Adapter> add_adapter(const std::string& name) {
        auto adapter = std::make_shared<Adapter>(name);
        adapters_.push_back(adapter);
        return adapter;
    }

    bool fail_adapters = false;

private:
    std::vector<std::shared_ptr<Adapter>> adapters_;
};

} // namespace fake
