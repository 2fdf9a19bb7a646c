/**
 * @file event_bus_core.cpp
 * @brief Queue-backed event bus implementation
 */

#include "event_bus_core.hpp"

#include <algorithm>
#include <cstring>

extern "C" {
#include "esp_heap_caps.h"
#include "esp_log.h"
}

static const char* TAG = "event_bus";

namespace event_bus_core {

// =============================================================================
// PayloadPool
// =============================================================================

void* PayloadPool::acquire(size_t size)
{
    if (size > config::kMaxPayloadSize) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
        if (!slot.in_use) {
            slot.in_use = true;
            hits_.fetch_add(1, std::memory_order_relaxed);
            return slot.buffer;
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
}

bool PayloadPool::release(void* ptr)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < config::kPayloadPoolSize; ++i) {
        if (ptr == slots_[i].buffer) {
            if (!slots_[i].in_use) {
                ESP_LOGW(TAG, "Double release of pool slot %u", static_cast<unsigned>(i));
            }
            slots_[i].in_use = false;
            return true;
        }
    }
    return false;
}

// =============================================================================
// SubscriberRegistry
// =============================================================================

bool SubscriberRegistry::subscribe(event_type_t type, event_callback_t callback, void* user_ctx)
{
    if (callback == nullptr) {
        ESP_LOGE(TAG, "Cannot subscribe with null callback");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[static_cast<uint32_t>(type)].push_back({callback, user_ctx});
    ESP_LOGD(TAG, "Subscriber registered for event type %u", static_cast<unsigned>(type));
    return true;
}

bool SubscriberRegistry::unsubscribe(event_type_t type, event_callback_t callback, void* user_ctx)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = subscribers_.find(static_cast<uint32_t>(type));
    if (it == subscribers_.end()) {
        return false;
    }

    auto& list = it->second;
    auto found = std::find_if(list.begin(), list.end(), [&](const Subscriber& sub) {
        return sub.callback == callback && sub.user_ctx == user_ctx;
    });
    if (found == list.end()) {
        ESP_LOGW(TAG, "Subscriber for event type %u not found", static_cast<unsigned>(type));
        return false;
    }

    list.erase(found);
    return true;
}

void SubscriberRegistry::dispatch(event_bus_t* bus_handle, const event_t& event)
{
    // Callbacks may (un)subscribe, so they run on a copy
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(static_cast<uint32_t>(event.type));
        if (it == subscribers_.end() || it->second.empty()) {
            ESP_LOGV(TAG, "No subscribers for event type %u", static_cast<unsigned>(event.type));
            return;
        }
        targets = it->second;
    }

    for (const auto& sub : targets) {
        sub.callback(bus_handle, &event, sub.user_ctx);
    }
}

uint32_t SubscriberRegistry::count() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t total = 0;
    for (const auto& pair : subscribers_) {
        total += static_cast<uint32_t>(pair.second.size());
    }
    return total;
}

// =============================================================================
// EventBus
// =============================================================================

EventBus::EventBus()
{
    queue_mutex_ = xSemaphoreCreateMutex();
    if (queue_mutex_ == nullptr) {
        ESP_LOGE(TAG, "Failed to create queue mutex");
    }
}

EventBus::~EventBus()
{
    deinit();
    if (queue_mutex_ != nullptr) {
        vSemaphoreDelete(queue_mutex_);
        queue_mutex_ = nullptr;
    }
}

bool EventBus::init(uint32_t queue_length)
{
    if (initialized_.load(std::memory_order_acquire)) {
        ESP_LOGW(TAG, "EventBus already initialized");
        return true;
    }

    queue_length_ = queue_length;
    queue_ = xQueueCreate(queue_length, sizeof(QueueItem));
    if (queue_ == nullptr) {
        ESP_LOGE(TAG, "Failed to create event queue");
        return false;
    }

    initialized_.store(true, std::memory_order_release);
    ESP_LOGI(TAG, "EventBus initialized (queue length %u)", static_cast<unsigned>(queue_length));
    return true;
}

void EventBus::deinit()
{
    if (!initialized_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    if (queue_ != nullptr) {
        QueueItem item;
        while (xQueueReceive(queue_, &item, 0) == pdTRUE) {
            free_payload(item.event.data, item.from_pool);
        }
        vQueueDelete(queue_);
        queue_ = nullptr;
    }

    ESP_LOGI(TAG, "EventBus deinitialized");
}

bool EventBus::subscribe(event_type_t type, event_callback_t callback, void* user_ctx)
{
    return registry_.subscribe(type, callback, user_ctx);
}

bool EventBus::unsubscribe(event_type_t type, event_callback_t callback, void* user_ctx)
{
    return registry_.unsubscribe(type, callback, user_ctx);
}

bool EventBus::publish(const event_t& event)
{
    if (!initialized_.load(std::memory_order_acquire)) {
        ESP_LOGE(TAG, "Cannot publish: EventBus not initialized");
        return false;
    }

    QueueItem item{};
    item.event = event;
    item.event.data = nullptr;
    item.from_pool = false;

    if (event.data != nullptr && event.data_size > 0) {
        item.event.data = copy_payload(event, item.from_pool);
        if (item.event.data == nullptr) {
            allocation_failures_.fetch_add(1, std::memory_order_relaxed);
            ESP_LOGE(TAG, "Failed to allocate payload of %u bytes",
                     static_cast<unsigned>(event.data_size));
            return false;
        }
    } else {
        item.event.data_size = 0;
    }

    ScopedMutex lock(queue_mutex_);
    if (!lock.is_locked()) {
        ESP_LOGE(TAG, "Failed to acquire queue mutex");
        free_payload(item.event.data, item.from_pool);
        return false;
    }

    if (xQueueSend(queue_, &item, 0) != pdTRUE) {
        dropped_total_.fetch_add(1, std::memory_order_relaxed);
        free_payload(item.event.data, item.from_pool);
        ESP_LOGW(TAG, "Event queue full, dropped event type %u", static_cast<unsigned>(event.type));
        return false;
    }

    published_total_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void EventBus::dispatch_task_loop(event_bus_t* bus_handle)
{
    QueueItem item;

    while (initialized_.load(std::memory_order_acquire)) {
        if (xQueueReceive(queue_, &item, config::kDispatchPollTicks) != pdTRUE) {
            continue;
        }

        registry_.dispatch(bus_handle, item.event);
        dispatched_total_.fetch_add(1, std::memory_order_relaxed);
        free_payload(item.event.data, item.from_pool);
    }
}

EventBus::Metrics EventBus::get_metrics() const
{
    Metrics m{};
    m.subscribers = registry_.count();
    m.published_total = published_total_.load(std::memory_order_relaxed);
    m.dispatched_total = dispatched_total_.load(std::memory_order_relaxed);
    m.dropped_total = dropped_total_.load(std::memory_order_relaxed);
    m.allocation_failures = allocation_failures_.load(std::memory_order_relaxed);
    m.queue_capacity = queue_length_;
    m.queue_depth = (queue_ != nullptr) ? static_cast<uint32_t>(uxQueueMessagesWaiting(queue_)) : 0;
    m.pool_hits = pool_.hits();
    m.pool_misses = pool_.misses();
    return m;
}

void* EventBus::copy_payload(const event_t& event, bool& from_pool)
{
    void* ptr = pool_.acquire(event.data_size);
    from_pool = ptr != nullptr;
    if (ptr == nullptr) {
        ptr = heap_caps_malloc(event.data_size, MALLOC_CAP_8BIT);
    }
    if (ptr != nullptr) {
        std::memcpy(ptr, event.data, event.data_size);
    }
    return ptr;
}

void EventBus::free_payload(void* ptr, bool from_pool)
{
    if (ptr == nullptr) {
        return;
    }
    if (from_pool && pool_.release(ptr)) {
        return;
    }
    heap_caps_free(ptr);
}

EventBus* from_handle(const event_bus_t* bus)
{
    if (bus == nullptr) {
        return nullptr;
    }
    return static_cast<EventBus*>(bus->impl_data);
}

} // namespace event_bus_core
