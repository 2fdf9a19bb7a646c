/**
 * @file gatt_transport.hpp
 * @brief GATT client primitives the engine drives (platform supplied)
 *
 * Every operation is asynchronous: the call returns Error::Ok once the
 * request is accepted and the completion runs later, from any task.
 * A non-Ok return means the completion will never run.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <string>

#include "ancs_error.hpp"
#include "ancs_protocol.hpp"

namespace ancs {

/**
 * @brief Remote phone, supplied by the caller and kept across reconnects
 */
struct DeviceHandle {
    std::string address;      // "AA:BB:CC:DD:EE:FF"
    uint8_t address_type{0};  // transport specific (public / random)
    std::string name;

    bool same_device(const DeviceHandle& other) const
    {
        return address == other.address && address_type == other.address_type;
    }
};

/**
 * @brief Unsolicited transport events
 */
class GattTransportListener {
public:
    virtual ~GattTransportListener() = default;

    virtual void on_disconnected(int reason) = 0;
    virtual void on_characteristic_notified(CharacteristicId characteristic,
                                            std::span<const uint8_t> bytes) = 0;
};

class GattTransport {
public:
    using Completion = std::function<void(Error)>;

    virtual ~GattTransport() = default;

    virtual void set_listener(GattTransportListener* listener) = 0;

    /**
     * @brief Open the link (encrypted) to @p device
     */
    virtual Error connect(const DeviceHandle& device, Completion on_connected) = 0;

    /**
     * @brief Find the ANCS service, its three characteristics and the CCCDs
     */
    virtual Error discover_services(Completion on_discovered) = 0;

    /**
     * @brief Enable notifications on @p characteristic through its CCCD
     */
    virtual Error subscribe(CharacteristicId characteristic, Completion on_subscribed) = 0;

    virtual Error write_characteristic(CharacteristicId characteristic,
                                       std::span<const uint8_t> bytes,
                                       Completion on_written) = 0;

    /**
     * @brief Drop the link or the pending connection
     *
     * Pending completions are discarded, and no on_disconnected() is
     * reported for a link closed this way.
     */
    virtual void cancel_connection() = 0;
};

} // namespace ancs
