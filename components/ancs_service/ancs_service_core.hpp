/**
 * @file ancs_service_core.hpp
 * @brief Firmware host of the ANCS engine
 *
 * Owns the NimBLE transport, the esp_timer scheduler and the engine, and
 * bridges engine events onto the event bus:
 * - NotificationReceived -> EVENT_ANCS_NOTIFICATION_RECEIVED
 * - NotificationRemoved  -> EVENT_ANCS_NOTIFICATION_REMOVED
 * - ConnectionChanged    -> EVENT_ANCS_CONNECTION_CHANGED
 * - ReconnectExhausted   -> EVENT_ANCS_RECONNECT_EXHAUSTED
 * Debug events go to the log and, for errors, to the diagnostic logger.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "esp_timer_scheduler.hpp"
#include "nimble_gatt_transport.hpp"
#include "notification_engine.hpp"

extern "C" {
#include "ancs_service.h"
#include "esp_err.h"
#include "event_bus.h"
#include "freertos/FreeRTOS.h"
}

namespace ancs_service {

namespace config {
constexpr uint32_t kBootTaskStackSize = 4096;
constexpr UBaseType_t kBootTaskPriority = 4;
constexpr uint32_t kSyncPollMs = 100;
constexpr uint32_t kSyncTimeoutMs = 10000;
} // namespace config

esp_err_t to_esp_err(ancs::Error err);

class AncsService {
public:
    explicit AncsService(event_bus_t* bus);
    ~AncsService();

    AncsService(const AncsService&) = delete;
    AncsService& operator=(const AncsService&) = delete;

    esp_err_t init();
    esp_err_t start();

    esp_err_t connect(const ancs::DeviceHandle& device);
    esp_err_t disconnect();
    esp_err_t shutdown();

    ancs_service_status_t get_status() const;

private:
    static void boot_task(void* arg);
    void connect_last_device();

    void on_engine_event(const ancs::EngineEvent& event);
    void on_connection_changed(const ancs::EngineEvent& event);
    void on_debug(const ancs::EngineEvent& event);
    void publish(event_type_t type, void* data, size_t size);

    event_bus_t* bus_;

    // Declared before engine_: the engine detaches from both on destruction
    ancs::NimbleGattTransport transport_;
    ancs::EspTimerScheduler scheduler_;
    std::unique_ptr<ancs::NotificationEngine> engine_;
    ancs::EventChannel::SubscriptionId subscription_{0};

    std::atomic<bool> started_{false};
    std::atomic<uint32_t> publish_failures_{0};
};

} // namespace ancs_service
