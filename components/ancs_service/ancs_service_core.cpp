/**
 * @file ancs_service_core.cpp
 * @brief Engine hosting, bus bridging and boot reconnect
 */

#include "ancs_service_core.hpp"

#include <string>

#include "bus_payloads.hpp"
#include "config_manager_core.hpp"

extern "C" {
#include "diagnostic_logger.h"
#include "esp_log.h"
#include "freertos/task.h"
}

static const char* TAG = "ancs_service";

namespace ancs_service {

esp_err_t to_esp_err(ancs::Error err)
{
    switch (err) {
        case ancs::Error::Ok:
            return ESP_OK;
        case ancs::Error::InvalidArgument:
            return ESP_ERR_INVALID_ARG;
        case ancs::Error::AlreadyInProgress:
        case ancs::Error::InvalidState:
        case ancs::Error::NotConnected:
        case ancs::Error::TransportUnavailable:
            return ESP_ERR_INVALID_STATE;
        case ancs::Error::ConnectTimeout:
        case ancs::Error::RequestTimeout:
            return ESP_ERR_TIMEOUT;
        case ancs::Error::QueueFull:
            return ESP_ERR_NO_MEM;
        default:
            return ESP_FAIL;
    }
}

AncsService::AncsService(event_bus_t* bus) : bus_(bus) {}

AncsService::~AncsService()
{
    if (engine_) {
        engine_->events().unsubscribe(subscription_);
        engine_->shutdown();
    }
}

esp_err_t AncsService::init()
{
    if (engine_) {
        ESP_LOGW(TAG, "ANCS service already initialized");
        return ESP_OK;
    }

    const ancs::EngineConfig engine_config = ::config::ConfigManager::instance().engine_config();
    auto validation = ancs::Validator::validate(engine_config);
    if (!validation) {
        ESP_LOGE(TAG, "Engine configuration rejected: %s", validation.error_message.c_str());
        return ESP_ERR_INVALID_ARG;
    }

    engine_ = std::make_unique<ancs::NotificationEngine>(transport_, scheduler_, engine_config);
    subscription_ = engine_->events().subscribe(
        [this](const ancs::EngineEvent& event) { on_engine_event(event); });

    ESP_LOGI(TAG, "ANCS engine ready (attr timeout %u ms, %u attempts, backlog %u)",
             static_cast<unsigned>(engine_config.attribute_timeout_ms),
             static_cast<unsigned>(engine_config.attribute_retries) + 1,
             static_cast<unsigned>(engine_config.backlog_capacity));
    return ESP_OK;
}

esp_err_t AncsService::start()
{
    if (!engine_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (started_.exchange(true)) {
        return ESP_OK;
    }

    esp_err_t err = transport_.init();
    if (err != ESP_OK) {
        started_.store(false);
        return err;
    }

    if (!::config::ConfigManager::instance().auto_connect_on_boot()) {
        ESP_LOGI(TAG, "Auto-connect on boot disabled");
        return ESP_OK;
    }

    BaseType_t rc = xTaskCreate(boot_task, "ancs_boot", config::kBootTaskStackSize,
                                this, config::kBootTaskPriority, nullptr);
    if (rc != pdPASS) {
        ESP_LOGE(TAG, "Failed to start boot reconnect task (rc=%ld)", static_cast<long>(rc));
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

void AncsService::boot_task(void* arg)
{
    auto* self = static_cast<AncsService*>(arg);

    uint32_t waited_ms = 0;
    while (!self->transport_.is_synced() && waited_ms < config::kSyncTimeoutMs) {
        vTaskDelay(pdMS_TO_TICKS(config::kSyncPollMs));
        waited_ms += config::kSyncPollMs;
    }

    if (self->transport_.is_synced()) {
        self->connect_last_device();
    } else {
        ESP_LOGW(TAG, "BLE host not synced after %u ms, skipping boot reconnect",
                 static_cast<unsigned>(waited_ms));
    }
    vTaskDelete(nullptr);
}

void AncsService::connect_last_device()
{
    auto device = ::config::ConfigManager::instance().last_device();
    if (!device) {
        ESP_LOGI(TAG, "No stored phone, waiting for a connect request");
        return;
    }

    ESP_LOGI(TAG, "Reconnecting to stored phone %s (%s)",
             device->address.c_str(), device->name.c_str());
    esp_err_t err = connect(*device);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "Boot reconnect not started: %s", esp_err_to_name(err));
    }
}

esp_err_t AncsService::connect(const ancs::DeviceHandle& device)
{
    if (!engine_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (!ancs::Validator::is_valid_device_address(device.address) || device.address.empty()) {
        return ESP_ERR_INVALID_ARG;
    }

    const ancs::Error err = engine_->connect(device);
    if (err != ancs::Error::Ok) {
        ESP_LOGW(TAG, "connect(%s) rejected: %s", device.address.c_str(), ancs::error_to_name(err));
    }
    return to_esp_err(err);
}

esp_err_t AncsService::disconnect()
{
    if (!engine_) {
        return ESP_ERR_INVALID_STATE;
    }
    engine_->disconnect();
    return ESP_OK;
}

esp_err_t AncsService::shutdown()
{
    if (!engine_) {
        return ESP_ERR_INVALID_STATE;
    }
    engine_->shutdown();
    ESP_LOGI(TAG, "ANCS engine shut down");
    return ESP_OK;
}

ancs_service_status_t AncsService::get_status() const
{
    ancs_service_status_t status = {};
    status.bus_publish_failures = publish_failures_.load(std::memory_order_relaxed);
    if (!engine_) {
        return status;
    }

    status.initialized = true;
    status.state = to_bus_link_state(engine_->connection_state());

    if (auto device = engine_->device()) {
        status.address_type = device->address_type;
        copy_truncated(status.address, sizeof(status.address), device->address);
        copy_truncated(status.device_name, sizeof(status.device_name), device->name);
    }

    const auto stats = engine_->get_stats();
    status.connected = stats.connected;
    status.last_event_time_ms = stats.last_event_time_ms;
    status.last_error = static_cast<uint8_t>(stats.last_error);
    status.notification_count = stats.notification_count;
    status.removed_count = stats.removed_count;
    status.malformed_packets = stats.malformed_packets;
    status.filtered_count = stats.filtered_count;

    status.commands_written = stats.queue.commands_written;
    status.retries = stats.queue.retries;
    status.timeouts = stats.queue.timeouts;
    status.protocol_errors = stats.queue.protocol_errors;
    status.write_failures = stats.queue.write_failures;
    status.enriched = stats.queue.enriched;
    status.degraded = stats.queue.degraded;
    status.drained = stats.queue.drained;

    status.connect_attempts = stats.connection.connect_attempts;
    status.connect_failures = stats.connection.connect_failures;
    status.drops = stats.connection.drops;
    status.reconnects_scheduled = stats.connection.reconnects_scheduled;
    return status;
}

// =============================================================================
// Engine events
// =============================================================================

void AncsService::on_engine_event(const ancs::EngineEvent& event)
{
    switch (event.kind) {
        case ancs::EngineEventKind::NotificationReceived: {
            ESP_LOGI(TAG, "Notification %lu [%s] %s",
                     static_cast<unsigned long>(event.record.notification_uid),
                     event.record.category_name.c_str(),
                     ancs::display_text(event.record).c_str());
            ESP_LOGD(TAG, "%s", record_to_json(event.record).c_str());

            auto payload = make_notification_payload(event.record, event.error);
            publish(EVENT_ANCS_NOTIFICATION_RECEIVED, &payload, sizeof(payload));
            break;
        }

        case ancs::EngineEventKind::NotificationRemoved: {
            ESP_LOGI(TAG, "Notification %lu removed",
                     static_cast<unsigned long>(event.record.notification_uid));

            auto payload = make_removed_payload(event.record);
            publish(EVENT_ANCS_NOTIFICATION_REMOVED, &payload, sizeof(payload));
            break;
        }

        case ancs::EngineEventKind::ConnectionChanged:
            on_connection_changed(event);
            break;

        case ancs::EngineEventKind::ReconnectExhausted: {
            ESP_LOGW(TAG, "Gave up reconnecting to %s after %lu attempts",
                     event.device_name ? event.device_name->c_str() : "?",
                     static_cast<unsigned long>(event.attempts));

            auto payload = make_exhausted_payload(event.device_name, event.attempts);
            publish(EVENT_ANCS_RECONNECT_EXHAUSTED, &payload, sizeof(payload));
            break;
        }

        case ancs::EngineEventKind::Debug:
            on_debug(event);
            break;
    }
}

void AncsService::on_connection_changed(const ancs::EngineEvent& event)
{
    const auto device = engine_ ? engine_->device() : std::nullopt;

    ESP_LOGI(TAG, "Link %s (%s), reason %s",
             ancs::connection_state_name(event.state),
             event.device_name ? event.device_name->c_str() : "?",
             ancs::error_to_name(event.error));

    if (event.state == ancs::ConnectionState::Connected && device) {
        esp_err_t err = ::config::ConfigManager::instance().set_last_device(*device);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Failed to remember %s: %s", device->address.c_str(), esp_err_to_name(err));
        }
    }

    auto payload = make_connection_payload(event.state, device, event.error);
    publish(EVENT_ANCS_CONNECTION_CHANGED, &payload, sizeof(payload));
}

void AncsService::on_debug(const ancs::EngineEvent& event)
{
    switch (event.debug_kind) {
        case ancs::DebugKind::ParsedAttributes:
            ESP_LOGD(TAG, "attributes %s", attributes_to_json(event.attributes).c_str());
            break;

        case ancs::DebugKind::Error: {
            ESP_LOGW(TAG, "%s (%s)", event.text.c_str(), ancs::error_to_name(event.error));
            const std::string line = std::string(ancs::error_to_name(event.error)) + ": " + event.text;
            diagnostic_logger_append(DIAG_LOG_SOURCE_ANCS_PROTOCOL, line.c_str());
            break;
        }

        case ancs::DebugKind::ConnectionInfo:
            ESP_LOGI(TAG, "%s", event.text.c_str());
            diagnostic_logger_append(DIAG_LOG_SOURCE_CONNECTION, event.text.c_str());
            break;

        default:
            ESP_LOGD(TAG, "%s %s", ancs::debug_kind_name(event.debug_kind), event.text.c_str());
            break;
    }
}

void AncsService::publish(event_type_t type, void* data, size_t size)
{
    if (bus_ == nullptr) {
        return;
    }

    event_t evt = {};
    evt.type = type;
    evt.data = data;
    evt.data_size = size;
    if (!event_bus_publish(bus_, &evt)) {
        publish_failures_.fetch_add(1, std::memory_order_relaxed);
        ESP_LOGW(TAG, "Failed to publish event type %u", static_cast<unsigned>(type));
    }
}

} // namespace ancs_service
