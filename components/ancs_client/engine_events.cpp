#include "engine_events.hpp"

namespace ancs {

const char* connection_state_name(ConnectionState state)
{
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
    }
    return "Unknown";
}

const char* debug_kind_name(DebugKind kind)
{
    switch (kind) {
        case DebugKind::NotificationSourceRaw: return "NS";
        case DebugKind::ControlPointCommand:   return "CP";
        case DebugKind::DataSourceRaw:         return "DS";
        case DebugKind::ParsedAttributes:      return "ATTR";
        case DebugKind::ConnectionInfo:        return "CONN";
        case DebugKind::Error:                 return "ERR";
    }
    return "?";
}

const char* engine_event_kind_name(EngineEventKind kind)
{
    switch (kind) {
        case EngineEventKind::NotificationReceived: return "NotificationReceived";
        case EngineEventKind::NotificationRemoved:  return "NotificationRemoved";
        case EngineEventKind::ConnectionChanged:    return "ConnectionChanged";
        case EngineEventKind::ReconnectExhausted:   return "ReconnectExhausted";
        case EngineEventKind::Debug:                return "Debug";
    }
    return "Unknown";
}

} // namespace ancs
