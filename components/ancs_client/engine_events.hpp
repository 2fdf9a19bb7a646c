/**
 * @file engine_events.hpp
 * @brief Events published by the notification engine
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ancs_error.hpp"
#include "attribute_reassembler.hpp"
#include "notification_record.hpp"

namespace ancs {

enum class ConnectionState : uint8_t {
    Disconnected = 0,
    Connecting,
    Connected,
};

const char* connection_state_name(ConnectionState state);

enum class DebugKind : uint8_t {
    NotificationSourceRaw,
    ControlPointCommand,
    DataSourceRaw,
    ParsedAttributes,
    ConnectionInfo,
    Error,
};

const char* debug_kind_name(DebugKind kind);

enum class EngineEventKind : uint8_t {
    NotificationReceived = 0,
    NotificationRemoved,
    ConnectionChanged,
    ReconnectExhausted,
    Debug,
};

const char* engine_event_kind_name(EngineEventKind kind);

namespace event_mask {
constexpr uint32_t bit(EngineEventKind kind) { return 1u << static_cast<uint32_t>(kind); }

constexpr uint32_t kNotifications =
    bit(EngineEventKind::NotificationReceived) | bit(EngineEventKind::NotificationRemoved);
constexpr uint32_t kConnection =
    bit(EngineEventKind::ConnectionChanged) | bit(EngineEventKind::ReconnectExhausted);
constexpr uint32_t kDebug = bit(EngineEventKind::Debug);
constexpr uint32_t kAll = kNotifications | kConnection | kDebug;
} // namespace event_mask

/**
 * @brief Tagged event; only the fields of @ref kind are meaningful
 *
 * NotificationReceived / NotificationRemoved: record, error (Ok when the
 *   record is enriched, otherwise why it is not).
 * ConnectionChanged: state, device_name, error (why the link went down).
 * ReconnectExhausted: device_name, attempts, error.
 * Debug: debug_kind, text (hex dump or message), attributes for
 *   ParsedAttributes, error for Error.
 */
struct EngineEvent {
    EngineEventKind kind{EngineEventKind::Debug};
    Error error{Error::Ok};

    NotificationRecord record;

    ConnectionState state{ConnectionState::Disconnected};
    std::optional<std::string> device_name;
    uint32_t attempts{0};

    DebugKind debug_kind{DebugKind::Error};
    std::string text;
    AttributeMap attributes;
};

} // namespace ancs
