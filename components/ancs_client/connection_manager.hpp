/**
 * @file connection_manager.hpp
 * @brief Owns the GATT session: connect, discovery, subscriptions, reconnect
 *
 * State machine:
 *
 *   Disconnected --connect()--> Connecting --subscribed--> Connected
 *        ^                          |                          |
 *        +-------- failure ---------+------- drop / error -----+
 *
 * Only one attempt may be in flight; connect() while Connecting returns
 * Error::AlreadyInProgress. The connect timeout covers the whole attempt
 * (link, discovery and both subscriptions). Data Source is subscribed
 * before Notification Source.
 *
 * After a drop or a failed attempt, and while auto-reconnect is enabled,
 * a new attempt is scheduled after min(base * 2^n, cap) milliseconds, n
 * counting consecutive failures. Once max_reconnect_attempts have been
 * scheduled without success the observer gets on_reconnect_exhausted().
 */

#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "ancs_error.hpp"
#include "attribute_request_queue.hpp"
#include "engine_config.hpp"
#include "engine_events.hpp"
#include "gatt_transport.hpp"
#include "scheduler.hpp"
#include "serial_context.hpp"

namespace ancs {

class ConnectionObserver {
public:
    virtual ~ConnectionObserver() = default;

    /**
     * @param reason Ok for a requested transition, otherwise why the
     *               link or the attempt ended
     */
    virtual void on_connection_state_changed(ConnectionState state,
                                             const DeviceHandle& device,
                                             Error reason) = 0;
    virtual void on_characteristic_notified(CharacteristicId characteristic,
                                            std::span<const uint8_t> bytes) = 0;
    virtual void on_reconnect_scheduled(uint32_t delay_ms, uint32_t attempt) = 0;
    virtual void on_reconnect_exhausted(const DeviceHandle& device, uint32_t attempts) = 0;
};

class ConnectionManager : public ControlPointWriter, private GattTransportListener {
public:
    ConnectionManager(SerialContext& context,
                      GattTransport& transport,
                      Scheduler& scheduler,
                      const EngineConfig& config);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_observer(ConnectionObserver* observer);

    /**
     * @brief Start connecting to @p device
     *
     * Ok means the attempt started (or the device is already connected);
     * its outcome arrives through the observer.
     */
    Error connect(const DeviceHandle& device);

    /**
     * @brief Tear the session down and stop reconnecting
     */
    void disconnect();

    /**
     * @brief disconnect(), then detach from the transport for good
     */
    void shutdown();

    ConnectionState state() const;
    std::optional<DeviceHandle> device() const;
    uint32_t reconnect_attempts() const;
    bool reconnect_pending() const;

    Error write_control_point(std::span<const uint8_t> command,
                              GattTransport::Completion on_written) override;

    static uint32_t backoff_delay_ms(const EngineConfig& config, uint32_t attempt);

    struct Stats {
        uint32_t connect_attempts;
        uint32_t connect_failures;
        uint32_t connections;
        uint32_t drops;
        uint32_t reconnects_scheduled;
        Error last_error;
    };

    Stats get_stats() const;

private:
    enum class Stage : uint8_t {
        Idle,
        Linking,
        Discovering,
        SubscribingDataSource,
        SubscribingNotificationSource,
        Ready,
    };

    Error start_attempt();
    void on_link_result(uint64_t session, Error result);
    void on_discovery_result(uint64_t session, Error result);
    void on_subscribe_result(uint64_t session, CharacteristicId characteristic, Error result);
    void on_connect_timeout(uint64_t session);
    void fail_attempt(Error reason);

    void schedule_reconnect();
    void on_reconnect_timer(uint64_t token);
    void cancel_timer(Scheduler::TimerId& timer);
    void close_session();
    void set_state(ConnectionState state, Error reason);

    // GattTransportListener
    void on_disconnected(int reason) override;
    void on_characteristic_notified(CharacteristicId characteristic,
                                    std::span<const uint8_t> bytes) override;

    SerialContext& context_;
    GattTransport& transport_;
    Scheduler& scheduler_;
    const EngineConfig& config_;
    ConnectionObserver* observer_{nullptr};

    ConnectionState state_{ConnectionState::Disconnected};
    Stage stage_{Stage::Idle};
    std::optional<DeviceHandle> device_;

    // Bumped whenever a session ends; callbacks of older sessions are dropped
    uint64_t session_{0};
    uint64_t reconnect_token_{0};
    Scheduler::TimerId connect_timer_{Scheduler::kInvalidTimer};
    Scheduler::TimerId reconnect_timer_{Scheduler::kInvalidTimer};

    bool auto_reconnect_{false};
    bool shut_down_{false};
    uint32_t reconnect_attempts_{0};
    Stats stats_{};
};

} // namespace ancs
