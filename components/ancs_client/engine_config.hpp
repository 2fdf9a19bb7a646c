/**
 * @file engine_config.hpp
 * @brief Tunables of the ANCS client engine
 */

#pragma once

#include <cstdint>

namespace ancs {

enum class DrainPolicy : uint8_t {
    DeliverUnenriched, // pending records are emitted with "content unavailable"
    Discard,
};

namespace defaults {
constexpr uint32_t kAttributeTimeoutMs = 5000;
constexpr uint8_t kAttributeRetries = 2;          // 3 attempts in total
constexpr uint32_t kConnectTimeoutMs = 15000;
constexpr uint32_t kReconnectBaseDelayMs = 5000;
constexpr uint32_t kReconnectMaxDelayMs = 60000;
constexpr uint32_t kMaxReconnectAttempts = 10;
constexpr uint16_t kTitleMaxLength = 128;
constexpr uint16_t kSubtitleMaxLength = 128;
constexpr uint16_t kMessageMaxLength = 1024;
constexpr uint32_t kBacklogCapacity = 32;
} // namespace defaults

struct EngineConfig {
    uint32_t attribute_timeout_ms{defaults::kAttributeTimeoutMs};
    uint8_t attribute_retries{defaults::kAttributeRetries};
    uint32_t connect_timeout_ms{defaults::kConnectTimeoutMs};

    bool auto_reconnect{true};
    uint32_t reconnect_base_delay_ms{defaults::kReconnectBaseDelayMs};
    uint32_t reconnect_max_delay_ms{defaults::kReconnectMaxDelayMs};
    uint32_t max_reconnect_attempts{defaults::kMaxReconnectAttempts};

    uint16_t title_max_length{defaults::kTitleMaxLength};
    uint16_t subtitle_max_length{defaults::kSubtitleMaxLength};
    uint16_t message_max_length{defaults::kMessageMaxLength};

    uint32_t backlog_capacity{defaults::kBacklogCapacity};
    DrainPolicy drain_policy{DrainPolicy::DeliverUnenriched};

    bool ignore_pre_existing{false};
    bool ignore_silent{false};
};

} // namespace ancs
