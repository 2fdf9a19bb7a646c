#include "config_validator.hpp"

#include <cctype>

namespace ancs {

namespace {

Validator::ValidationResult invalid(const char* message)
{
    return {false, message};
}

} // anonymous namespace

Validator::ValidationResult Validator::validate(const EngineConfig& cfg)
{
    if (!is_valid_uint32_range(cfg.attribute_timeout_ms,
                               limits::kAttributeTimeoutMinMs,
                               limits::kAttributeTimeoutMaxMs)) {
        return invalid("attribute_timeout_ms out of range");
    }

    if (cfg.attribute_retries > limits::kAttributeRetriesMax) {
        return invalid("attribute_retries out of range");
    }

    if (!is_valid_uint32_range(cfg.connect_timeout_ms,
                               limits::kConnectTimeoutMinMs,
                               limits::kConnectTimeoutMaxMs)) {
        return invalid("connect_timeout_ms out of range");
    }

    if (!is_valid_uint32_range(cfg.reconnect_base_delay_ms,
                               limits::kReconnectDelayMinMs,
                               limits::kReconnectDelayMaxMs)) {
        return invalid("reconnect_base_delay_ms out of range");
    }

    if (!is_valid_uint32_range(cfg.reconnect_max_delay_ms,
                               limits::kReconnectDelayMinMs,
                               limits::kReconnectDelayMaxMs)) {
        return invalid("reconnect_max_delay_ms out of range");
    }

    if (cfg.reconnect_base_delay_ms > cfg.reconnect_max_delay_ms) {
        return invalid("reconnect_base_delay_ms must be <= reconnect_max_delay_ms");
    }

    if (cfg.max_reconnect_attempts > limits::kReconnectAttemptsMax) {
        return invalid("max_reconnect_attempts out of range");
    }

    if (cfg.title_max_length == 0 || cfg.title_max_length > limits::kAttributeMaxLength) {
        return invalid("title_max_length out of range");
    }

    if (cfg.subtitle_max_length == 0 || cfg.subtitle_max_length > limits::kAttributeMaxLength) {
        return invalid("subtitle_max_length out of range");
    }

    if (cfg.message_max_length == 0 || cfg.message_max_length > limits::kAttributeMaxLength) {
        return invalid("message_max_length out of range");
    }

    if (!is_valid_uint32_range(cfg.backlog_capacity, 1, limits::kBacklogCapacityMax)) {
        return invalid("backlog_capacity out of range");
    }

    return {true, ""};
}

bool Validator::is_valid_device_address(std::string_view address)
{
    if (address.empty()) {
        return true;
    }

    // AA:BB:CC:DD:EE:FF
    if (address.size() != 17) {
        return false;
    }

    for (size_t i = 0; i < address.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(address[i]);
        if (i % 3 == 2) {
            if (c != ':') {
                return false;
            }
        } else if (!std::isxdigit(c)) {
            return false;
        }
    }
    return true;
}

bool Validator::is_valid_uint32_range(uint32_t value, uint32_t min, uint32_t max)
{
    return value >= min && value <= max;
}

} // namespace ancs
