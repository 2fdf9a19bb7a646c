/**
 * @file diagnostic_logger_core.hpp
 * @brief Persistent ring of ANCS link and notification history
 *
 * - Thread-safe ring buffer of short text lines
 * - Batched NVS persistence (10 entries or 60s)
 * - Retry with exponential backoff on NVS failures
 * - Subscribes to the ANCS events of the bus
 */

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>

extern "C" {
#include "diagnostic_logger.h"
#include "event_bus.h"
#include "event_types.h"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
}

namespace diagnostic {

// =============================================================================
// Configuration
// =============================================================================

namespace config {
constexpr uint32_t kMaxEntries = 64;
constexpr uint32_t kMaxPayloadSize = 96;
constexpr uint32_t kBatchFlushThreshold = 10;
constexpr uint32_t kTimeFlushThresholdMs = 60000;
constexpr uint32_t kMaxRetries = 3;
constexpr uint32_t kRetryDelayMs = 100;
constexpr std::string_view kNvsNamespace = "diaglog";
constexpr std::string_view kNvsKey = "ancs_ring_v1";
} // namespace config

// =============================================================================
// RAII Mutex Guard
// =============================================================================

class ScopedMutex {
public:
    explicit ScopedMutex(SemaphoreHandle_t mutex, TickType_t timeout = pdMS_TO_TICKS(100))
        : mutex_(mutex), locked_(false)
    {
        if (mutex_ != nullptr) {
            locked_ = xSemaphoreTake(mutex_, timeout) == pdTRUE;
        }
    }

    ~ScopedMutex()
    {
        if (locked_ && mutex_ != nullptr) {
            xSemaphoreGive(mutex_);
        }
    }

    ScopedMutex(const ScopedMutex&) = delete;
    ScopedMutex& operator=(const ScopedMutex&) = delete;

    [[nodiscard]] bool is_locked() const { return locked_; }

private:
    SemaphoreHandle_t mutex_;
    bool locked_;
};

// =============================================================================
// Diagnostic Log Entry
// =============================================================================

#pragma pack(push, 1)
struct LogEntry {
    uint64_t timestamp_ms;
    uint32_t sequence;
    uint16_t length;
    uint8_t source;
    uint8_t truncated;
    uint8_t payload[config::kMaxPayloadSize];

    LogEntry() : timestamp_ms(0), sequence(0), length(0), source(0), truncated(0), payload{0} {}

    std::string_view text() const
    {
        return std::string_view(reinterpret_cast<const char*>(payload), length);
    }
};
#pragma pack(pop)

// =============================================================================
// Ring Buffer (Thread-Safe)
// =============================================================================

class RingBuffer {
public:
    RingBuffer();
    ~RingBuffer() = default;

    /**
     * @brief Store @p message, cut to kMaxPayloadSize bytes
     *
     * Overwrites the oldest entry once full.
     */
    bool append(diag_log_source_t source, std::string_view message, uint64_t timestamp_ms);
    std::optional<LogEntry> get(uint32_t index) const;

    uint32_t count() const;
    uint32_t capacity() const { return config::kMaxEntries; }
    uint32_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    uint32_t overwritten() const { return overwritten_.load(std::memory_order_relaxed); }
    bool is_healthy() const { return healthy_.load(std::memory_order_acquire); }

    struct Snapshot {
        uint32_t head;
        uint32_t count;
        uint32_t next_sequence;
        uint32_t dropped;
        std::array<LogEntry, config::kMaxEntries> entries;
    };

    Snapshot take_snapshot() const;
    void restore_snapshot(const Snapshot& snapshot);

private:
    mutable SemaphoreHandle_t mutex_;
    std::array<LogEntry, config::kMaxEntries> entries_;
    uint32_t head_{0};
    uint32_t count_{0};
    uint32_t next_sequence_{0};
    std::atomic<uint32_t> dropped_{0};
    std::atomic<uint32_t> overwritten_{0};
    std::atomic<bool> healthy_{true};
};

// =============================================================================
// NVS Persister
// =============================================================================

class NvsPersister {
public:
    NvsPersister() = default;

    esp_err_t save(const RingBuffer::Snapshot& snapshot);
    esp_err_t load(RingBuffer::Snapshot& snapshot);

    uint32_t save_count() const { return save_count_.load(std::memory_order_relaxed); }
    uint32_t retry_count() const { return retry_count_.load(std::memory_order_relaxed); }

private:
    esp_err_t save_impl(const RingBuffer::Snapshot& snapshot);
    esp_err_t load_impl(RingBuffer::Snapshot& snapshot);

    std::atomic<uint32_t> save_count_{0};
    std::atomic<uint32_t> retry_count_{0};
};

// =============================================================================
// Batch Flush Manager
// =============================================================================

class FlushManager {
public:
    FlushManager() = default;

    void record_write();
    bool should_flush(uint64_t now_ms) const;
    void mark_flushed(uint64_t now_ms);

    uint32_t pending_writes() const { return pending_writes_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint32_t> pending_writes_{0};
    std::atomic<uint64_t> last_flush_ms_{0};
};

// =============================================================================
// Statistics
// =============================================================================

struct Statistics {
    std::atomic<uint64_t> entries_written{0};
    std::atomic<uint64_t> entries_dropped{0};
    std::atomic<uint64_t> nvs_saves{0};
    std::atomic<uint64_t> nvs_failures{0};
};

// =============================================================================
// Diagnostic Logger (Singleton)
// =============================================================================

class Logger {
public:
    static Logger& instance();

    esp_err_t init(event_bus_t* bus);
    void append(diag_log_source_t source, std::string_view message);
    void flush();

    struct Metrics {
        uint32_t ring_used;
        uint32_t ring_capacity;
        uint32_t ring_dropped;
        uint32_t ring_overwritten;
        bool ring_healthy;
        uint32_t pending_writes;
        uint64_t entries_written;
        uint64_t entries_dropped;
        uint64_t nvs_saves;
        uint64_t nvs_failures;
    };

    Metrics get_metrics() const;
    diag_logger_status_t get_status() const;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void load_from_nvs();
    void maybe_flush();

    // Event handlers
    static void handle_connection_changed(event_bus_t* bus, const event_t* event, void* user_ctx);
    static void handle_reconnect_exhausted(event_bus_t* bus, const event_t* event, void* user_ctx);
    static void handle_notification_received(event_bus_t* bus, const event_t* event, void* user_ctx);
    static void handle_notification_removed(event_bus_t* bus, const event_t* event, void* user_ctx);

    std::atomic<bool> initialized_{false};
    event_bus_t* bus_{nullptr};

    RingBuffer ring_;
    NvsPersister persister_;
    FlushManager flush_manager_;
    Statistics stats_;
};

} // namespace diagnostic
