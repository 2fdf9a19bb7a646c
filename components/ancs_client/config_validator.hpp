/**
 * @file config_validator.hpp
 * @brief Range checks for EngineConfig and stored device identity
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "engine_config.hpp"

namespace ancs {

namespace limits {
constexpr uint32_t kAttributeTimeoutMinMs = 500;
constexpr uint32_t kAttributeTimeoutMaxMs = 60000;
constexpr uint8_t kAttributeRetriesMax = 5;
constexpr uint32_t kConnectTimeoutMinMs = 1000;
constexpr uint32_t kConnectTimeoutMaxMs = 120000;
constexpr uint32_t kReconnectDelayMinMs = 100;
constexpr uint32_t kReconnectDelayMaxMs = 3600000;
constexpr uint32_t kReconnectAttemptsMax = 1000;
constexpr uint16_t kAttributeMaxLength = 2048;
constexpr uint32_t kBacklogCapacityMax = 256;
} // namespace limits

class Validator {
public:
    struct ValidationResult {
        bool valid;
        std::string error_message;

        explicit operator bool() const { return valid; }
    };

    static ValidationResult validate(const EngineConfig& cfg);

    /**
     * @brief Empty, or six colon separated hex octets
     */
    static bool is_valid_device_address(std::string_view address);

private:
    static bool is_valid_uint32_range(uint32_t value, uint32_t min, uint32_t max);
};

} // namespace ancs
