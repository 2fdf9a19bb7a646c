// components/event_bus/event_bus.cpp (extern "C")
#include "event_bus.h"

#include <new>

#include "event_bus_core.hpp"

extern "C" {
#include "esp_log.h"
}

static const char* TAG = "event_bus_api";

extern "C" void event_bus_init(event_bus_t* bus)
{
    if (bus == nullptr) {
        return;
    }
    if (bus->impl_data != nullptr) {
        ESP_LOGW(TAG, "event_bus_init called twice");
        return;
    }

    auto* instance = new (std::nothrow) event_bus_core::EventBus();
    if (instance == nullptr) {
        ESP_LOGE(TAG, "Out of memory creating the event bus");
        return;
    }
    if (!instance->init()) {
        delete instance;
        return;
    }
    bus->impl_data = instance;
}

extern "C" bool event_bus_subscribe(event_bus_t* bus,
                                    event_type_t type,
                                    event_callback_t callback,
                                    void* user_ctx)
{
    auto* instance = event_bus_core::from_handle(bus);
    return instance != nullptr && instance->subscribe(type, callback, user_ctx);
}

extern "C" bool event_bus_unsubscribe(event_bus_t* bus,
                                      event_type_t type,
                                      event_callback_t callback,
                                      void* user_ctx)
{
    auto* instance = event_bus_core::from_handle(bus);
    return instance != nullptr && instance->unsubscribe(type, callback, user_ctx);
}

extern "C" bool event_bus_publish(event_bus_t* bus, const event_t* event)
{
    auto* instance = event_bus_core::from_handle(bus);
    if (instance == nullptr || event == nullptr) {
        return false;
    }
    return instance->publish(*event);
}

extern "C" event_bus_metrics_t event_bus_get_metrics(const event_bus_t* bus)
{
    event_bus_metrics_t out = {};
    auto* instance = event_bus_core::from_handle(bus);
    if (instance != nullptr) {
        const auto m = instance->get_metrics();
        out.subscribers = m.subscribers;
        out.published_total = m.published_total;
    }
    return out;
}

extern "C" bool event_bus_get_queue_metrics(const event_bus_t* bus, event_bus_queue_metrics_t* out)
{
    auto* instance = event_bus_core::from_handle(bus);
    if (instance == nullptr || out == nullptr) {
        return false;
    }

    const auto m = instance->get_metrics();
    out->queue_capacity = m.queue_capacity;
    out->messages_waiting = m.queue_depth;
    out->dropped_events = m.dropped_total;
    return true;
}

extern "C" void event_bus_dispatch_task(void* ctx)
{
    auto* bus = static_cast<event_bus_t*>(ctx);
    auto* instance = event_bus_core::from_handle(bus);
    if (instance != nullptr) {
        instance->dispatch_task_loop(bus);
    } else {
        ESP_LOGE(TAG, "Dispatch task started without an initialized bus");
    }
    vTaskDelete(nullptr);
}
