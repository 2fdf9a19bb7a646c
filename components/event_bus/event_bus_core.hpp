/**
 * @file event_bus_core.hpp
 * @brief Queue-backed publish/subscribe bus behind the C API of event_bus.h
 *
 * Publishing copies the payload and posts it on a FreeRTOS queue; a
 * dedicated task (event_bus_dispatch_task) pops events and invokes the
 * subscribers of their type. Payloads up to kMaxPayloadSize come from a
 * fixed pool, larger ones from the heap.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

extern "C" {
#include "event_bus.h"
#include "event_types.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
}

namespace event_bus_core {

namespace config {
constexpr uint32_t kDefaultQueueLength = 32;
constexpr size_t kPayloadPoolSize = 16;
constexpr size_t kMaxPayloadSize = sizeof(ancs_notification_event_t);
constexpr TickType_t kDispatchPollTicks = pdMS_TO_TICKS(100);
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
        if (locked_) {
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
// Payload pool
// =============================================================================

class PayloadPool {
public:
    PayloadPool() = default;

    PayloadPool(const PayloadPool&) = delete;
    PayloadPool& operator=(const PayloadPool&) = delete;

    /**
     * @return nullptr when every slot is taken or @p size does not fit
     */
    void* acquire(size_t size);
    bool release(void* ptr);

    uint32_t hits() const { return hits_.load(std::memory_order_relaxed); }
    uint32_t misses() const { return misses_.load(std::memory_order_relaxed); }

private:
    struct Slot {
        alignas(8) uint8_t buffer[config::kMaxPayloadSize];
        bool in_use{false};
    };

    std::mutex mutex_;
    Slot slots_[config::kPayloadPoolSize];
    std::atomic<uint32_t> hits_{0};
    std::atomic<uint32_t> misses_{0};
};

// =============================================================================
// Subscribers
// =============================================================================

struct Subscriber {
    event_callback_t callback;
    void* user_ctx;
};

class SubscriberRegistry {
public:
    SubscriberRegistry() = default;

    bool subscribe(event_type_t type, event_callback_t callback, void* user_ctx);
    bool unsubscribe(event_type_t type, event_callback_t callback, void* user_ctx);

    /**
     * @brief Invoke the subscribers of event.type, without holding the lock
     */
    void dispatch(event_bus_t* bus_handle, const event_t& event);

    uint32_t count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<uint32_t, std::vector<Subscriber>> subscribers_;
};

// =============================================================================
// Bus
// =============================================================================

struct QueueItem {
    event_t event;
    bool from_pool;
};

class EventBus {
public:
    EventBus();
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    bool init(uint32_t queue_length = config::kDefaultQueueLength);
    void deinit();

    bool subscribe(event_type_t type, event_callback_t callback, void* user_ctx);
    bool unsubscribe(event_type_t type, event_callback_t callback, void* user_ctx);

    bool publish(const event_t& event);

    /**
     * @brief Dispatch loop; returns once deinit() has been called
     */
    void dispatch_task_loop(event_bus_t* bus_handle);

    struct Metrics {
        uint32_t subscribers;
        uint32_t published_total;
        uint32_t dispatched_total;
        uint32_t dropped_total;
        uint32_t allocation_failures;
        uint32_t queue_capacity;
        uint32_t queue_depth;
        uint32_t pool_hits;
        uint32_t pool_misses;
    };

    Metrics get_metrics() const;

private:
    void* copy_payload(const event_t& event, bool& from_pool);
    void free_payload(void* ptr, bool from_pool);

    std::atomic<bool> initialized_{false};
    QueueHandle_t queue_{nullptr};
    uint32_t queue_length_{config::kDefaultQueueLength};
    SemaphoreHandle_t queue_mutex_{nullptr};

    SubscriberRegistry registry_;
    PayloadPool pool_;

    std::atomic<uint32_t> published_total_{0};
    std::atomic<uint32_t> dispatched_total_{0};
    std::atomic<uint32_t> dropped_total_{0};
    std::atomic<uint32_t> allocation_failures_{0};
};

/**
 * @brief C++ instance stored in @p bus, or nullptr before event_bus_init()
 */
EventBus* from_handle(const event_bus_t* bus);

} // namespace event_bus_core
