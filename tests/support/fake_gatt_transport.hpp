// tests/support/fake_gatt_transport.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

#include "gatt_transport.hpp"

namespace ancs_test {

/**
 * Scripted transport: requests are recorded and their completions held
 * until the test releases them with complete_*().
 */
class FakeGattTransport : public ancs::GattTransport {
public:
    struct Write {
        ancs::CharacteristicId characteristic;
        ancs::ByteBuffer bytes;
    };

    // Immediate results returned by the next calls
    ancs::Error connect_result{ancs::Error::Ok};
    ancs::Error write_result{ancs::Error::Ok};

    void set_listener(ancs::GattTransportListener* listener) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = listener;
    }

    ancs::Error connect(const ancs::DeviceHandle& device, Completion on_connected) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_devices_.push_back(device);
        if (connect_result != ancs::Error::Ok) {
            return connect_result;
        }
        pending_connect_ = std::move(on_connected);
        return ancs::Error::Ok;
    }

    ancs::Error discover_services(Completion on_discovered) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++discoveries_;
        pending_discovery_ = std::move(on_discovered);
        return ancs::Error::Ok;
    }

    ancs::Error subscribe(ancs::CharacteristicId characteristic, Completion on_subscribed) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.push_back(characteristic);
        pending_subscribe_ = std::move(on_subscribed);
        return ancs::Error::Ok;
    }

    ancs::Error write_characteristic(ancs::CharacteristicId characteristic,
                                     std::span<const uint8_t> bytes,
                                     Completion on_written) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        writes_.push_back({characteristic, ancs::ByteBuffer(bytes.begin(), bytes.end())});
        if (write_result != ancs::Error::Ok) {
            return write_result;
        }
        pending_writes_.push_back(std::move(on_written));
        return ancs::Error::Ok;
    }

    void cancel_connection() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cancellations_;
        pending_connect_ = nullptr;
        pending_discovery_ = nullptr;
        pending_subscribe_ = nullptr;
        pending_writes_.clear();
    }

    // ---- test controls ---------------------------------------------------

    void complete_connect(ancs::Error result = ancs::Error::Ok) { release(pending_connect_, result); }
    void complete_discovery(ancs::Error result = ancs::Error::Ok) { release(pending_discovery_, result); }
    void complete_subscribe(ancs::Error result = ancs::Error::Ok) { release(pending_subscribe_, result); }

    void complete_write(ancs::Error result = ancs::Error::Ok)
    {
        Completion done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_writes_.empty()) {
                return;
            }
            done = std::move(pending_writes_.front());
            pending_writes_.pop_front();
        }
        if (done) {
            done(result);
        }
    }

    void complete_handshake()
    {
        complete_connect();
        complete_discovery();
        complete_subscribe();
        complete_subscribe();
    }

    void notify(ancs::CharacteristicId characteristic, const std::vector<uint8_t>& bytes)
    {
        ancs::GattTransportListener* listener = current_listener();
        if (listener != nullptr) {
            listener->on_characteristic_notified(characteristic, bytes);
        }
    }

    void drop(int reason = 0x13)
    {
        ancs::GattTransportListener* listener = current_listener();
        if (listener != nullptr) {
            listener->on_disconnected(reason);
        }
    }

    // ---- inspection ------------------------------------------------------

    bool has_listener() const { return current_listener() != nullptr; }

    size_t connect_calls() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_devices_.size();
    }

    int cancellations() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancellations_;
    }

    std::vector<ancs::CharacteristicId> subscriptions() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_;
    }

    std::vector<Write> writes() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    size_t write_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_.size();
    }

private:
    void release(Completion& slot, ancs::Error result)
    {
        Completion done;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done = std::move(slot);
            slot = nullptr;
        }
        if (done) {
            done(result);
        }
    }

    ancs::GattTransportListener* current_listener() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return listener_;
    }

    mutable std::mutex mutex_;
    ancs::GattTransportListener* listener_{nullptr};
    std::vector<ancs::DeviceHandle> connected_devices_;
    std::vector<ancs::CharacteristicId> subscriptions_;
    std::vector<Write> writes_;
    Completion pending_connect_;
    Completion pending_discovery_;
    Completion pending_subscribe_;
    std::deque<Completion> pending_writes_;
    int discoveries_{0};
    int cancellations_{0};
};

} // namespace ancs_test
