/**
 * @file ancs_error.hpp
 * @brief Error codes shared by the ANCS protocol core and client engine
 */

#pragma once

#include <cstdint>

namespace ancs {

enum class Error : uint8_t {
    Ok = 0,
    MalformedPacket,        // Notification Source shorter than 8 bytes
    NeedMoreData,           // Not an error: buffer ends inside a record
    ProtocolError,          // Data Source header does not match the request
    TransportWriteFailure,
    TransportUnavailable,
    ConnectFailure,
    ConnectTimeout,
    DiscoveryFailure,
    SubscribeFailure,
    AlreadyInProgress,
    NotConnected,
    InvalidState,
    InvalidArgument,
    RequestTimeout,
    QueueFull,
    ConnectionLost,
    MaxRetriesExceeded,
    MaxReconnectAttemptsExceeded,
};

const char* error_to_name(Error err);

} // namespace ancs
