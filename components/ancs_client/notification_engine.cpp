#include "notification_engine.hpp"

#include <cstdio>
#include <utility>

namespace ancs {

NotificationEngine::NotificationEngine(GattTransport& transport,
                                       Scheduler& scheduler,
                                       EngineConfig config)
    : config_(config),
      scheduler_(scheduler),
      connection_(context_, transport, scheduler, config_),
      queue_(context_, connection_, scheduler, config_)
{
    app_names_.seed_defaults();

    context_.set_exit_hook([this]() { flush_events(); });
    connection_.set_observer(this);
    queue_.set_resolve_handler([this](NotificationRecord&& record, Error outcome) {
        handle_resolved(std::move(record), outcome);
    });
    queue_.set_debug_handler([this](DebugKind kind, std::string text, const AttributeMap* attributes) {
        post_debug(kind, std::move(text), Error::Ok, attributes);
    });
}

NotificationEngine::~NotificationEngine()
{
    shutdown();
    context_.set_exit_hook(nullptr);
    connection_.set_observer(nullptr);
}

// =============================================================================
// Caller API
// =============================================================================

Error NotificationEngine::connect(const DeviceHandle& device)
{
    if (device.address.empty()) {
        return Error::InvalidArgument;
    }

    Error result = Error::Ok;
    context_.run([&] {
        if (shut_down_) {
            result = Error::InvalidState;
            return;
        }
        result = connection_.connect(device);
        if (result != Error::Ok && result != Error::AlreadyInProgress) {
            last_error_ = result;
        }
    });
    return result;
}

void NotificationEngine::disconnect()
{
    context_.run([&] { connection_.disconnect(); });
}

void NotificationEngine::shutdown()
{
    context_.run([&] {
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        connection_.shutdown();
        queue_.drain(config_.drain_policy);
    });
}

void NotificationEngine::on_notification_source(std::span<const uint8_t> bytes)
{
    context_.run([&] { handle_notification_source(bytes); });
}

void NotificationEngine::on_data_source(std::span<const uint8_t> bytes)
{
    context_.run([&] {
        last_event_time_ms_ = scheduler_.now_ms();
        post_debug(DebugKind::DataSourceRaw, to_hex(bytes));
        queue_.on_data_source(bytes);
    });
}

ConnectionState NotificationEngine::connection_state() const
{
    return connection_.state();
}

std::optional<DeviceHandle> NotificationEngine::device() const
{
    return connection_.device();
}

NotificationEngine::Stats NotificationEngine::get_stats() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());

    Stats stats;
    stats.connected = connection_.state() == ConnectionState::Connected;
    stats.last_event_time_ms = last_event_time_ms_;
    stats.last_error = last_error_;
    stats.notification_count = notification_count_;
    stats.removed_count = removed_count_;
    stats.malformed_packets = malformed_packets_;
    stats.filtered_count = filtered_count_;
    stats.queue = queue_.get_stats();
    stats.connection = connection_.get_stats();
    return stats;
}

// =============================================================================
// Notification Source path (context held)
// =============================================================================

void NotificationEngine::handle_notification_source(std::span<const uint8_t> bytes)
{
    last_event_time_ms_ = scheduler_.now_ms();
    post_debug(DebugKind::NotificationSourceRaw, to_hex(bytes));

    NotificationSourceEvent event{};
    if (decode_notification_source(bytes, event) != Error::Ok) {
        ++malformed_packets_;
        last_error_ = Error::MalformedPacket;

        char text[64];
        std::snprintf(text, sizeof(text), "malformed Notification Source (%u bytes), dropped",
                      static_cast<unsigned>(bytes.size()));
        post_debug(DebugKind::Error, text, Error::MalformedPacket);
        return;
    }

    switch (event.event_id) {
        case EventId::Removed: {
            ++removed_count_;
            EngineEvent removed;
            removed.kind = EngineEventKind::NotificationRemoved;
            removed.record = make_notification_record(next_record_id_++, event, last_event_time_ms_);
            post(std::move(removed));
            return;
        }

        case EventId::Added:
        case EventId::Modified:
            break;

        default: {
            char text[48];
            std::snprintf(text, sizeof(text), "reserved event id %u ignored",
                          static_cast<unsigned>(event.event_id));
            post_debug(DebugKind::Error, text, Error::ProtocolError);
            return;
        }
    }

    if (is_filtered(event)) {
        ++filtered_count_;
        return;
    }

    queue_.enqueue(make_notification_record(next_record_id_++, event, last_event_time_ms_));
}

bool NotificationEngine::is_filtered(const NotificationSourceEvent& event) const
{
    if (config_.ignore_pre_existing && (event.event_flags & event_flags::kPreExisting) != 0) {
        return true;
    }
    if (config_.ignore_silent && (event.event_flags & event_flags::kSilent) != 0) {
        return true;
    }
    return false;
}

void NotificationEngine::handle_resolved(NotificationRecord&& record, Error outcome)
{
    if (record.app_identifier) {
        if (auto name = app_names_.lookup(*record.app_identifier)) {
            record.app_display_name = std::move(*name);
        }
    }

    ++notification_count_;
    if (outcome == Error::MaxRetriesExceeded || outcome == Error::QueueFull) {
        last_error_ = outcome;
    }

    EngineEvent received;
    received.kind = EngineEventKind::NotificationReceived;
    received.error = outcome;
    received.record = std::move(record);
    post(std::move(received));
}

// =============================================================================
// ConnectionObserver (context held)
// =============================================================================

void NotificationEngine::on_connection_state_changed(ConnectionState state,
                                                     const DeviceHandle& device,
                                                     Error reason)
{
    if (reason != Error::Ok) {
        last_error_ = reason;
    }

    EngineEvent changed;
    changed.kind = EngineEventKind::ConnectionChanged;
    changed.state = state;
    changed.device_name = device.name.empty() ? device.address : device.name;
    changed.error = reason;
    post(std::move(changed));

    if (state == ConnectionState::Disconnected) {
        queue_.drain(config_.drain_policy);
    }
}

void NotificationEngine::on_characteristic_notified(CharacteristicId characteristic,
                                                    std::span<const uint8_t> bytes)
{
    switch (characteristic) {
        case CharacteristicId::NotificationSource:
            handle_notification_source(bytes);
            break;
        case CharacteristicId::DataSource:
            on_data_source(bytes);
            break;
        case CharacteristicId::ControlPoint:
            break;
    }
}

void NotificationEngine::on_reconnect_scheduled(uint32_t delay_ms, uint32_t attempt)
{
    char text[64];
    std::snprintf(text, sizeof(text), "reconnect attempt %lu in %lu ms",
                  static_cast<unsigned long>(attempt), static_cast<unsigned long>(delay_ms));
    post_debug(DebugKind::ConnectionInfo, text);
}

void NotificationEngine::on_reconnect_exhausted(const DeviceHandle& device, uint32_t attempts)
{
    last_error_ = Error::MaxReconnectAttemptsExceeded;

    EngineEvent exhausted;
    exhausted.kind = EngineEventKind::ReconnectExhausted;
    exhausted.device_name = device.name.empty() ? device.address : device.name;
    exhausted.attempts = attempts;
    exhausted.error = Error::MaxReconnectAttemptsExceeded;
    post(std::move(exhausted));
}

// =============================================================================
// Event delivery
// =============================================================================

void NotificationEngine::post(EngineEvent&& event)
{
    pending_events_.push_back(std::move(event));
}

void NotificationEngine::post_debug(DebugKind kind, std::string text, Error error,
                                    const AttributeMap* attributes)
{
    EngineEvent debug;
    debug.kind = EngineEventKind::Debug;
    debug.debug_kind = kind;
    debug.text = std::move(text);
    debug.error = error;
    if (attributes != nullptr) {
        debug.attributes = *attributes;
    }
    post(std::move(debug));
}

void NotificationEngine::flush_events()
{
    std::lock_guard<std::recursive_mutex> publish_lock(publish_mutex_);

    // A handler re-entered the engine; the outer loop publishes the rest
    if (flushing_) {
        return;
    }
    flushing_ = true;

    for (;;) {
        std::vector<EngineEvent> batch;
        {
            std::lock_guard<std::recursive_mutex> lock(context_.mutex());
            batch.swap(pending_events_);
        }
        if (batch.empty()) {
            break;
        }
        for (const auto& event : batch) {
            channel_.publish(event);
        }
    }

    flushing_ = false;
}

} // namespace ancs
