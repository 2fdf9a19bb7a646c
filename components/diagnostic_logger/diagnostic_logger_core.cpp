/**
 * @file diagnostic_logger_core.cpp
 * @brief Implementation of the diagnostic logger
 */

#include "diagnostic_logger_core.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>

extern "C" {
#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/task.h"
#include "nvs.h"
#include "nvs_flash.h"
}

static const char* TAG = "diag_logger_core";

namespace diagnostic {

// =============================================================================
// Helper Functions
// =============================================================================

static uint64_t now_ms() {
    return static_cast<uint64_t>(esp_timer_get_time() / 1000ULL);
}

static const char* link_state_name(ancs_link_state_t state) {
    switch (state) {
        case ANCS_LINK_CONNECTING:
            return "connecting";
        case ANCS_LINK_CONNECTED:
            return "connected";
        case ANCS_LINK_DISCONNECTED:
        default:
            return "disconnected";
    }
}

// =============================================================================
// RingBuffer Implementation
// =============================================================================

RingBuffer::RingBuffer() {
    mutex_ = xSemaphoreCreateMutex();
    if (mutex_ == nullptr) {
        ESP_LOGE(TAG, "Failed to create ring buffer mutex");
        healthy_.store(false, std::memory_order_release);
    }
}

bool RingBuffer::append(diag_log_source_t source, std::string_view message, uint64_t timestamp_ms) {
    if (message.empty()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    ScopedMutex lock(mutex_);
    if (!lock.is_locked()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        ESP_LOGE(TAG, "Failed to acquire ring buffer mutex");
        return false;
    }

    const size_t length = std::min<size_t>(message.size(), config::kMaxPayloadSize);

    LogEntry entry;
    entry.timestamp_ms = timestamp_ms;
    entry.sequence = next_sequence_++;
    entry.source = static_cast<uint8_t>(source);
    entry.length = static_cast<uint16_t>(length);
    entry.truncated = length < message.size() ? 1 : 0;
    std::memcpy(entry.payload, message.data(), length);

    entries_[head_] = entry;
    head_ = (head_ + 1) % config::kMaxEntries;

    if (count_ < config::kMaxEntries) {
        count_++;
    } else {
        overwritten_.fetch_add(1, std::memory_order_relaxed);
    }

    return true;
}

std::optional<LogEntry> RingBuffer::get(uint32_t index) const {
    ScopedMutex lock(mutex_);
    if (!lock.is_locked() || index >= count_) {
        return std::nullopt;
    }

    const uint32_t actual_idx = (head_ + config::kMaxEntries - count_ + index) % config::kMaxEntries;
    return entries_[actual_idx];
}

uint32_t RingBuffer::count() const {
    ScopedMutex lock(mutex_);
    if (!lock.is_locked()) {
        return 0;
    }
    return count_;
}

RingBuffer::Snapshot RingBuffer::take_snapshot() const {
    ScopedMutex lock(mutex_);

    Snapshot snapshot;
    snapshot.head = head_;
    snapshot.count = count_;
    snapshot.next_sequence = next_sequence_;
    snapshot.dropped = dropped_.load(std::memory_order_relaxed);
    snapshot.entries = entries_;

    return snapshot;
}

void RingBuffer::restore_snapshot(const Snapshot& snapshot) {
    if (snapshot.head >= config::kMaxEntries || snapshot.count > config::kMaxEntries) {
        ESP_LOGW(TAG, "Ignoring inconsistent snapshot (head=%u, count=%u)",
                 static_cast<unsigned>(snapshot.head), static_cast<unsigned>(snapshot.count));
        return;
    }

    ScopedMutex lock(mutex_);
    if (!lock.is_locked()) {
        ESP_LOGE(TAG, "Failed to restore snapshot: mutex timeout");
        return;
    }

    head_ = snapshot.head;
    count_ = snapshot.count;
    next_sequence_ = snapshot.next_sequence;
    dropped_.store(snapshot.dropped, std::memory_order_relaxed);
    entries_ = snapshot.entries;

    ESP_LOGI(TAG, "Restored snapshot: %u entries, %u dropped",
             static_cast<unsigned>(count_), static_cast<unsigned>(snapshot.dropped));
}

// =============================================================================
// NvsPersister Implementation
// =============================================================================

esp_err_t NvsPersister::save(const RingBuffer::Snapshot& snapshot) {
    esp_err_t err = save_impl(snapshot);

    if (err == ESP_OK) {
        save_count_.fetch_add(1, std::memory_order_relaxed);
        return ESP_OK;
    }

    for (uint32_t i = 0; i < config::kMaxRetries; ++i) {
        retry_count_.fetch_add(1, std::memory_order_relaxed);
        vTaskDelay(pdMS_TO_TICKS(config::kRetryDelayMs * (1u << i)));

        err = save_impl(snapshot);
        if (err == ESP_OK) {
            save_count_.fetch_add(1, std::memory_order_relaxed);
            return ESP_OK;
        }
    }

    ESP_LOGE(TAG, "Failed to save after %u retries: %s",
             static_cast<unsigned>(config::kMaxRetries), esp_err_to_name(err));
    return err;
}

esp_err_t NvsPersister::load(RingBuffer::Snapshot& snapshot) {
    return load_impl(snapshot);
}

esp_err_t NvsPersister::save_impl(const RingBuffer::Snapshot& snapshot) {
    nvs_handle_t handle;
    esp_err_t err = nvs_open(config::kNvsNamespace.data(), NVS_READWRITE, &handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to open NVS: %s", esp_err_to_name(err));
        return err;
    }

    err = nvs_set_blob(handle, config::kNvsKey.data(), &snapshot, sizeof(snapshot));
    if (err == ESP_OK) {
        err = nvs_commit(handle);
    }

    nvs_close(handle);

    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to persist snapshot: %s", esp_err_to_name(err));
    }

    return err;
}

esp_err_t NvsPersister::load_impl(RingBuffer::Snapshot& snapshot) {
    nvs_handle_t handle;
    size_t size = sizeof(snapshot);

    esp_err_t err = nvs_open(config::kNvsNamespace.data(), NVS_READONLY, &handle);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "No existing diagnostic log storage: %s", esp_err_to_name(err));
        return err;
    }

    err = nvs_get_blob(handle, config::kNvsKey.data(), &snapshot, &size);
    nvs_close(handle);

    if (err != ESP_OK || size != sizeof(snapshot)) {
        ESP_LOGW(TAG, "Invalid diagnostic log storage (err=%s, size=%u)",
                 esp_err_to_name(err), static_cast<unsigned>(size));
        return ESP_FAIL;
    }

    return ESP_OK;
}

// =============================================================================
// FlushManager Implementation
// =============================================================================

void FlushManager::record_write() {
    pending_writes_.fetch_add(1, std::memory_order_relaxed);
}

bool FlushManager::should_flush(uint64_t now_ms) const {
    const uint32_t pending = pending_writes_.load(std::memory_order_relaxed);
    if (pending >= config::kBatchFlushThreshold) {
        return true;
    }

    const uint64_t last_flush = last_flush_ms_.load(std::memory_order_relaxed);
    const uint64_t elapsed = now_ms - last_flush;

    return (pending > 0 && elapsed >= config::kTimeFlushThresholdMs);
}

void FlushManager::mark_flushed(uint64_t now_ms) {
    pending_writes_.store(0, std::memory_order_relaxed);
    last_flush_ms_.store(now_ms, std::memory_order_relaxed);
}

// =============================================================================
// Logger Implementation
// =============================================================================

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (initialized_.load(std::memory_order_acquire)) {
        flush();
    }
}

esp_err_t Logger::init(event_bus_t* bus) {
    if (bus == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    if (initialized_.load(std::memory_order_acquire)) {
        ESP_LOGW(TAG, "Logger already initialized");
        return ESP_OK;
    }

    bus_ = bus;

    load_from_nvs();
    flush_manager_.mark_flushed(now_ms());

    bool subscribed = true;
    subscribed &= event_bus_subscribe(bus, EVENT_ANCS_CONNECTION_CHANGED, handle_connection_changed, this);
    subscribed &= event_bus_subscribe(bus, EVENT_ANCS_RECONNECT_EXHAUSTED, handle_reconnect_exhausted, this);
    subscribed &= event_bus_subscribe(bus, EVENT_ANCS_NOTIFICATION_RECEIVED, handle_notification_received, this);
    subscribed &= event_bus_subscribe(bus, EVENT_ANCS_NOTIFICATION_REMOVED, handle_notification_removed, this);
    if (!subscribed) {
        ESP_LOGE(TAG, "Failed to subscribe to ANCS events");
        return ESP_FAIL;
    }

    initialized_.store(true, std::memory_order_release);

    ESP_LOGI(TAG, "Diagnostic logger initialized (entries=%u, dropped=%u)",
             static_cast<unsigned>(ring_.count()), static_cast<unsigned>(ring_.dropped()));
    return ESP_OK;
}

void Logger::append(diag_log_source_t source, std::string_view message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        ESP_LOGW(TAG, "Logger not initialized");
        return;
    }

    if (ring_.append(source, message, now_ms())) {
        stats_.entries_written.fetch_add(1, std::memory_order_relaxed);
        flush_manager_.record_write();
        maybe_flush();
    } else {
        stats_.entries_dropped.fetch_add(1, std::memory_order_relaxed);
    }
}

void Logger::flush() {
    const uint64_t now = now_ms();

    auto snapshot = ring_.take_snapshot();
    esp_err_t err = persister_.save(snapshot);

    if (err == ESP_OK) {
        stats_.nvs_saves.fetch_add(1, std::memory_order_relaxed);
        flush_manager_.mark_flushed(now);
        ESP_LOGD(TAG, "Flushed %u entries to NVS", static_cast<unsigned>(snapshot.count));
    } else {
        stats_.nvs_failures.fetch_add(1, std::memory_order_relaxed);
        ESP_LOGE(TAG, "Failed to flush to NVS: %s", esp_err_to_name(err));
    }
}

void Logger::maybe_flush() {
    if (flush_manager_.should_flush(now_ms())) {
        flush();
    }
}

void Logger::load_from_nvs() {
    // ~7 KB, kept off the task stack
    static RingBuffer::Snapshot snapshot;
    esp_err_t err = persister_.load(snapshot);

    if (err == ESP_OK) {
        ring_.restore_snapshot(snapshot);
        ESP_LOGI(TAG, "Loaded diagnostic logs from NVS");
    } else {
        ESP_LOGI(TAG, "No previous diagnostic logs found, starting fresh");
    }
}

Logger::Metrics Logger::get_metrics() const {
    Metrics m;
    m.ring_used = ring_.count();
    m.ring_capacity = ring_.capacity();
    m.ring_dropped = ring_.dropped();
    m.ring_overwritten = ring_.overwritten();
    m.ring_healthy = ring_.is_healthy();
    m.pending_writes = flush_manager_.pending_writes();
    m.entries_written = stats_.entries_written.load(std::memory_order_relaxed);
    m.entries_dropped = stats_.entries_dropped.load(std::memory_order_relaxed);
    m.nvs_saves = stats_.nvs_saves.load(std::memory_order_relaxed);
    m.nvs_failures = stats_.nvs_failures.load(std::memory_order_relaxed);
    return m;
}

diag_logger_status_t Logger::get_status() const {
    diag_logger_status_t status = {};
    status.dropped = ring_.dropped();
    status.healthy = ring_.is_healthy() && stats_.nvs_failures.load(std::memory_order_relaxed) == 0;

    event_bus_queue_metrics_t queue = {};
    if (bus_ != nullptr && event_bus_get_queue_metrics(bus_, &queue)) {
        status.event_queue_capacity = queue.queue_capacity;
        status.event_queue_depth = queue.messages_waiting;
        status.event_queue_drops = queue.dropped_events;
        status.event_queue_ready = true;
    }
    return status;
}

// =============================================================================
// Event Handlers
// =============================================================================

void Logger::handle_connection_changed(event_bus_t* bus, const event_t* event, void* user_ctx) {
    (void)bus;

    if (event == nullptr || event->data == nullptr || user_ctx == nullptr) {
        return;
    }

    auto* logger = static_cast<Logger*>(user_ctx);
    const auto* conn = static_cast<const ancs_connection_event_t*>(event->data);

    char message[config::kMaxPayloadSize];
    int len = snprintf(message, sizeof(message),
                      "link %s %s (%s) reason=%u",
                      link_state_name(conn->state), conn->address,
                      conn->device_name[0] ? conn->device_name : "?",
                      static_cast<unsigned>(conn->reason));

    if (len > 0) {
        logger->append(DIAG_LOG_SOURCE_CONNECTION,
                       std::string_view(message, std::min<size_t>(len, sizeof(message) - 1)));
    }
}

void Logger::handle_reconnect_exhausted(event_bus_t* bus, const event_t* event, void* user_ctx) {
    (void)bus;

    if (event == nullptr || event->data == nullptr || user_ctx == nullptr) {
        return;
    }

    auto* logger = static_cast<Logger*>(user_ctx);
    const auto* exhausted = static_cast<const ancs_reconnect_exhausted_t*>(event->data);

    char message[config::kMaxPayloadSize];
    int len = snprintf(message, sizeof(message),
                      "reconnect to %s abandoned after %lu attempts",
                      exhausted->device_name[0] ? exhausted->device_name : "?",
                      static_cast<unsigned long>(exhausted->attempts));

    if (len > 0) {
        logger->append(DIAG_LOG_SOURCE_CONNECTION,
                       std::string_view(message, std::min<size_t>(len, sizeof(message) - 1)));
    }
}

void Logger::handle_notification_received(event_bus_t* bus, const event_t* event, void* user_ctx) {
    (void)bus;

    if (event == nullptr || event->data == nullptr || user_ctx == nullptr) {
        return;
    }

    auto* logger = static_cast<Logger*>(user_ctx);
    const auto* notif = static_cast<const ancs_notification_event_t*>(event->data);

    // Content stays out of flash; only the envelope is kept
    char message[config::kMaxPayloadSize];
    int len = snprintf(message, sizeof(message),
                      "%s uid=%lu cat=%s app=%s enrich=%u res=%u",
                      notif->event_id == 1 ? "mod" : "add",
                      static_cast<unsigned long>(notif->notification_uid),
                      notif->category_name,
                      notif->app_identifier[0] ? notif->app_identifier : "-",
                      static_cast<unsigned>(notif->enrichment),
                      static_cast<unsigned>(notif->result));

    if (len > 0) {
        logger->append(DIAG_LOG_SOURCE_ANCS_PROTOCOL,
                       std::string_view(message, std::min<size_t>(len, sizeof(message) - 1)));
    }
}

void Logger::handle_notification_removed(event_bus_t* bus, const event_t* event, void* user_ctx) {
    (void)bus;

    if (event == nullptr || event->data == nullptr || user_ctx == nullptr) {
        return;
    }

    auto* logger = static_cast<Logger*>(user_ctx);
    const auto* removed = static_cast<const ancs_notification_removed_t*>(event->data);

    char message[config::kMaxPayloadSize];
    int len = snprintf(message, sizeof(message),
                      "del uid=%lu cat=%s",
                      static_cast<unsigned long>(removed->notification_uid),
                      removed->category_name);

    if (len > 0) {
        logger->append(DIAG_LOG_SOURCE_ANCS_PROTOCOL,
                       std::string_view(message, std::min<size_t>(len, sizeof(message) - 1)));
    }
}

} // namespace diagnostic

// =============================================================================
// C API
// =============================================================================

extern "C" {

esp_err_t diagnostic_logger_init(event_bus_t* bus) {
    return diagnostic::Logger::instance().init(bus);
}

void diagnostic_logger_append(diag_log_source_t source, const char* message) {
    if (message == nullptr) {
        return;
    }
    diagnostic::Logger::instance().append(source, message);
}

diag_logger_status_t diagnostic_logger_get_status(void) {
    return diagnostic::Logger::instance().get_status();
}

diag_logger_ring_info_t diagnostic_logger_get_ring_info(void) {
    const auto metrics = diagnostic::Logger::instance().get_metrics();

    diag_logger_ring_info_t info = {};
    info.used = metrics.ring_used;
    info.capacity = metrics.ring_capacity;
    info.dropped = metrics.ring_dropped;
    info.healthy = metrics.ring_healthy;
    return info;
}

} // extern "C"
