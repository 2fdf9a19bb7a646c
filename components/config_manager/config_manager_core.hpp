/**
 * @file config_manager_core.hpp
 * @brief Thread-safe persistent configuration of the ANCS bridge
 *
 * - Defaults from ancs::defaults, validated with ancs::Validator
 * - Versioned NVS blob with retry on transient errors
 * - Rollback of the in-memory copy when a write fails
 * - Change callbacks, run outside the lock
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config_validator.hpp"
#include "engine_config.hpp"
#include "gatt_transport.hpp"

extern "C" {
#include "config_manager.h"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
}

namespace config {

namespace constants {
constexpr std::string_view kNvsNamespace = "ancs_cfg";
constexpr std::string_view kNvsKey = "bridge_v1";
constexpr uint32_t kConfigVersion = 1;

constexpr uint32_t kNvsMaxRetries = 3;
constexpr uint32_t kNvsRetryDelayMs = 100;
} // namespace constants

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

    ~ScopedMutex() { unlock(); }

    ScopedMutex(const ScopedMutex&) = delete;
    ScopedMutex& operator=(const ScopedMutex&) = delete;

    void unlock()
    {
        if (locked_) {
            xSemaphoreGive(mutex_);
            locked_ = false;
        }
    }

    [[nodiscard]] bool is_locked() const { return locked_; }

private:
    SemaphoreHandle_t mutex_;
    bool locked_;
};

/**
 * @brief Whole-struct check: engine tunables, device identity, strings
 */
ancs::Validator::ValidationResult validate(const ancs_bridge_config_t& cfg);

ancs::EngineConfig to_engine_config(const ancs_bridge_config_t& cfg);

using ConfigObserverCallback = std::function<void(const ancs_bridge_config_t&)>;

class ObserverManager {
public:
    ObserverManager() = default;

    void add_callback(ConfigObserverCallback callback);
    void notify_all(const ancs_bridge_config_t& config);

private:
    std::vector<ConfigObserverCallback> callbacks_;
    std::mutex mutex_;
};

// =============================================================================
// NVS persistence
// =============================================================================

class NvsPersister {
public:
    NvsPersister() = default;

    esp_err_t save(const ancs_bridge_config_t& cfg);
    esp_err_t load(ancs_bridge_config_t& cfg);

    uint32_t save_count() const { return save_count_.load(std::memory_order_relaxed); }
    uint32_t load_count() const { return load_count_.load(std::memory_order_relaxed); }
    uint32_t retry_count() const { return retry_count_.load(std::memory_order_relaxed); }

private:
    esp_err_t save_impl(const ancs_bridge_config_t& cfg);
    esp_err_t load_impl(ancs_bridge_config_t& cfg);
    esp_err_t retry_operation(const std::function<esp_err_t()>& operation);

    std::atomic<uint32_t> save_count_{0};
    std::atomic<uint32_t> load_count_{0};
    std::atomic<uint32_t> retry_count_{0};
};

// =============================================================================
// Configuration Manager (Singleton)
// =============================================================================

class ConfigManager {
public:
    static ConfigManager& instance();

    esp_err_t init();

    ancs_bridge_config_t get() const;
    esp_err_t set(const ancs_bridge_config_t& cfg, bool persist = true);

    ancs::EngineConfig engine_config() const;

    /**
     * @brief Phone to reconnect to at boot, if one was stored
     */
    std::optional<ancs::DeviceHandle> last_device() const;
    bool auto_connect_on_boot() const;

    esp_err_t set_last_device(const ancs::DeviceHandle& device);
    esp_err_t forget_device();
    esp_err_t set_auto_connect_on_boot(bool enabled);

    void add_callback(ConfigObserverCallback callback);

    struct Stats {
        uint32_t saves;
        uint32_t loads;
        uint32_t retries;
        uint32_t validation_failures;
        bool dirty;
    };
    Stats get_stats() const;

    bool is_dirty() const { return dirty_.load(std::memory_order_acquire); }

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    static void apply_defaults(ancs_bridge_config_t& cfg);

    mutable SemaphoreHandle_t mutex_{nullptr};
    ancs_bridge_config_t config_{};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> dirty_{false};
    std::atomic<uint32_t> validation_failures_{0};

    NvsPersister persister_;
    ObserverManager observer_manager_;
};

} // namespace config
