/**
 * @file notification_engine.hpp
 * @brief ANCS client engine: connection, attribute fetches, event delivery
 *
 * Explicitly constructed around a transport and a scheduler supplied by the
 * host. All state changes are serialized on one SerialContext; events are
 * published on events() after the context is released, so handlers may
 * call back into the engine.
 *
 * Usage:
 * @code
 * ancs::NotificationEngine engine(transport, scheduler, config);
 * engine.events().subscribe([](const ancs::EngineEvent& evt) { ... },
 *                           ancs::event_mask::kNotifications);
 * engine.connect({"AA:BB:CC:DD:EE:FF", 1, "iPhone"});
 * @endcode
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ancs_error.hpp"
#include "app_name_cache.hpp"
#include "attribute_request_queue.hpp"
#include "connection_manager.hpp"
#include "engine_config.hpp"
#include "engine_events.hpp"
#include "event_channel.hpp"
#include "gatt_transport.hpp"
#include "scheduler.hpp"
#include "serial_context.hpp"

namespace ancs {

class NotificationEngine : private ConnectionObserver {
public:
    NotificationEngine(GattTransport& transport, Scheduler& scheduler, EngineConfig config = {});
    ~NotificationEngine() override;

    NotificationEngine(const NotificationEngine&) = delete;
    NotificationEngine& operator=(const NotificationEngine&) = delete;

    Error connect(const DeviceHandle& device);
    void disconnect();

    /**
     * @brief Disconnect, drain, cancel timers and detach from the transport
     *
     * The engine accepts no further connect() afterwards.
     */
    void shutdown();

    /**
     * @brief Notification Source payload (normally routed by the transport)
     */
    void on_notification_source(std::span<const uint8_t> bytes);

    /**
     * @brief Data Source payload (normally routed by the transport)
     */
    void on_data_source(std::span<const uint8_t> bytes);

    EventChannel& events() { return channel_; }
    AppNameCache& app_names() { return app_names_; }
    const EngineConfig& config() const { return config_; }

    ConnectionState connection_state() const;
    std::optional<DeviceHandle> device() const;

    struct Stats {
        bool connected;
        int64_t last_event_time_ms;
        Error last_error;
        uint32_t notification_count;
        uint32_t removed_count;
        uint32_t malformed_packets;
        uint32_t filtered_count;
        AttributeRequestQueue::Stats queue;
        ConnectionManager::Stats connection;
    };

    Stats get_stats() const;

private:
    // ConnectionObserver
    void on_connection_state_changed(ConnectionState state,
                                     const DeviceHandle& device,
                                     Error reason) override;
    void on_characteristic_notified(CharacteristicId characteristic,
                                    std::span<const uint8_t> bytes) override;
    void on_reconnect_scheduled(uint32_t delay_ms, uint32_t attempt) override;
    void on_reconnect_exhausted(const DeviceHandle& device, uint32_t attempts) override;

    void handle_resolved(NotificationRecord&& record, Error outcome);
    void handle_notification_source(std::span<const uint8_t> bytes);
    bool is_filtered(const NotificationSourceEvent& event) const;

    void post(EngineEvent&& event);
    void post_debug(DebugKind kind, std::string text, Error error = Error::Ok,
                    const AttributeMap* attributes = nullptr);
    void flush_events();

    const EngineConfig config_;
    Scheduler& scheduler_;

    mutable SerialContext context_;
    EventChannel channel_;
    AppNameCache app_names_;
    ConnectionManager connection_;
    AttributeRequestQueue queue_;

    std::vector<EngineEvent> pending_events_;
    std::recursive_mutex publish_mutex_;
    bool flushing_{false};

    bool shut_down_{false};
    uint64_t next_record_id_{1};
    int64_t last_event_time_ms_{0};
    Error last_error_{Error::Ok};
    uint32_t notification_count_{0};
    uint32_t removed_count_{0};
    uint32_t malformed_packets_{0};
    uint32_t filtered_count_{0};
};

} // namespace ancs
