#include "ancs_error.hpp"

namespace ancs {

const char* error_to_name(Error err)
{
    switch (err) {
        case Error::Ok:                           return "OK";
        case Error::MalformedPacket:              return "MALFORMED_PACKET";
        case Error::NeedMoreData:                 return "NEED_MORE_DATA";
        case Error::ProtocolError:                return "PROTOCOL_ERROR";
        case Error::TransportWriteFailure:        return "TRANSPORT_WRITE_FAILURE";
        case Error::TransportUnavailable:         return "TRANSPORT_UNAVAILABLE";
        case Error::ConnectFailure:               return "CONNECT_FAILURE";
        case Error::ConnectTimeout:               return "CONNECT_TIMEOUT";
        case Error::DiscoveryFailure:             return "DISCOVERY_FAILURE";
        case Error::SubscribeFailure:             return "SUBSCRIBE_FAILURE";
        case Error::AlreadyInProgress:            return "ALREADY_IN_PROGRESS";
        case Error::NotConnected:                 return "NOT_CONNECTED";
        case Error::InvalidState:                 return "INVALID_STATE";
        case Error::InvalidArgument:              return "INVALID_ARGUMENT";
        case Error::RequestTimeout:               return "REQUEST_TIMEOUT";
        case Error::QueueFull:                    return "QUEUE_FULL";
        case Error::ConnectionLost:               return "CONNECTION_LOST";
        case Error::MaxRetriesExceeded:           return "MAX_RETRIES_EXCEEDED";
        case Error::MaxReconnectAttemptsExceeded: return "MAX_RECONNECT_ATTEMPTS_EXCEEDED";
    }
    return "UNKNOWN";
}

} // namespace ancs
