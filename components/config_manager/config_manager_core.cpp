/**
 * @file config_manager_core.cpp
 * @brief Persistent configuration of the ANCS bridge
 */

#include "config_manager_core.hpp"

extern "C" {
#include "esp_log.h"
#include "nvs.h"
#include "nvs_flash.h"
#include "freertos/task.h"
}

#include <algorithm>
#include <cctype>
#include <cstring>

namespace config {

namespace {
const char* TAG = "cfg_mgr";

bool is_printable_ascii(std::string_view str)
{
    return std::all_of(str.begin(), str.end(), [](char c) {
        return std::isprint(static_cast<unsigned char>(c));
    });
}

// Null-terminated within its buffer and printable
bool is_safe_string(const char* str, size_t max_len)
{
    const size_t len = strnlen(str, max_len);
    if (len >= max_len) {
        return false;
    }
    return is_printable_ascii(std::string_view(str, len));
}

ancs::Validator::ValidationResult invalid(const char* message)
{
    return {false, message};
}

} // anonymous namespace

// =============================================================================
// Validation and conversion
// =============================================================================

ancs::Validator::ValidationResult validate(const ancs_bridge_config_t& cfg)
{
    if (cfg.version != constants::kConfigVersion) {
        return invalid("unsupported config version");
    }

    auto engine = ancs::Validator::validate(to_engine_config(cfg));
    if (!engine) {
        return engine;
    }

    if (cfg.drain_policy > ANCS_DRAIN_DISCARD) {
        return invalid("drain_policy out of range");
    }

    if (!is_safe_string(cfg.device_address, sizeof(cfg.device_address)) ||
        !ancs::Validator::is_valid_device_address(cfg.device_address)) {
        return invalid("device_address is not AA:BB:CC:DD:EE:FF");
    }

    if (!is_safe_string(cfg.device_name, sizeof(cfg.device_name))) {
        return invalid("device_name contains invalid characters");
    }

    return {true, ""};
}

ancs::EngineConfig to_engine_config(const ancs_bridge_config_t& cfg)
{
    ancs::EngineConfig engine;
    engine.attribute_timeout_ms = cfg.attribute_timeout_ms;
    engine.attribute_retries = cfg.attribute_retries;
    engine.connect_timeout_ms = cfg.connect_timeout_ms;
    engine.auto_reconnect = cfg.auto_reconnect;
    engine.reconnect_base_delay_ms = cfg.reconnect_base_delay_ms;
    engine.reconnect_max_delay_ms = cfg.reconnect_max_delay_ms;
    engine.max_reconnect_attempts = cfg.max_reconnect_attempts;
    engine.title_max_length = cfg.title_max_length;
    engine.subtitle_max_length = cfg.subtitle_max_length;
    engine.message_max_length = cfg.message_max_length;
    engine.backlog_capacity = cfg.backlog_capacity;
    engine.drain_policy = cfg.drain_policy == ANCS_DRAIN_DISCARD ? ancs::DrainPolicy::Discard
                                                                 : ancs::DrainPolicy::DeliverUnenriched;
    engine.ignore_pre_existing = cfg.ignore_pre_existing;
    engine.ignore_silent = cfg.ignore_silent;
    return engine;
}

// =============================================================================
// Observer Manager
// =============================================================================

void ObserverManager::add_callback(ConfigObserverCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void ObserverManager::notify_all(const ancs_bridge_config_t& config)
{
    std::vector<ConfigObserverCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = callbacks_;
    }

    for (const auto& callback : callbacks) {
        if (callback) {
            callback(config);
        }
    }
}

// =============================================================================
// NVS Persister
// =============================================================================

esp_err_t NvsPersister::save(const ancs_bridge_config_t& cfg)
{
    return retry_operation([this, &cfg]() { return save_impl(cfg); });
}

esp_err_t NvsPersister::load(ancs_bridge_config_t& cfg)
{
    return load_impl(cfg);
}

esp_err_t NvsPersister::save_impl(const ancs_bridge_config_t& cfg)
{
    nvs_handle_t handle;
    esp_err_t err = nvs_open(constants::kNvsNamespace.data(), NVS_READWRITE, &handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Failed to open NVS for save: %s", esp_err_to_name(err));
        return err;
    }

    err = nvs_set_blob(handle, constants::kNvsKey.data(), &cfg, sizeof(cfg));
    if (err == ESP_OK) {
        err = nvs_commit(handle);
    }
    nvs_close(handle);

    if (err == ESP_OK) {
        save_count_.fetch_add(1, std::memory_order_relaxed);
        ESP_LOGI(TAG, "Configuration saved to NVS");
    } else {
        ESP_LOGE(TAG, "Failed to save config: %s", esp_err_to_name(err));
    }
    return err;
}

esp_err_t NvsPersister::load_impl(ancs_bridge_config_t& cfg)
{
    nvs_handle_t handle;
    esp_err_t err = nvs_open(constants::kNvsNamespace.data(), NVS_READONLY, &handle);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "No existing config in NVS: %s", esp_err_to_name(err));
        return err;
    }

    size_t size = sizeof(cfg);
    err = nvs_get_blob(handle, constants::kNvsKey.data(), &cfg, &size);
    nvs_close(handle);

    if (err != ESP_OK || size != sizeof(cfg)) {
        ESP_LOGW(TAG, "Invalid stored config (err=%s, size=%u)",
                 esp_err_to_name(err), static_cast<unsigned>(size));
        return ESP_FAIL;
    }

    load_count_.fetch_add(1, std::memory_order_relaxed);
    return ESP_OK;
}

esp_err_t NvsPersister::retry_operation(const std::function<esp_err_t()>& operation)
{
    esp_err_t err = ESP_FAIL;

    for (uint32_t attempt = 0; attempt < constants::kNvsMaxRetries; ++attempt) {
        err = operation();
        if (err == ESP_OK) {
            return ESP_OK;
        }

        // A full partition needs intervention, not a retry
        if (err == ESP_ERR_NVS_NOT_ENOUGH_SPACE || err == ESP_ERR_NVS_PAGE_FULL) {
            break;
        }

        if (attempt + 1 < constants::kNvsMaxRetries) {
            retry_count_.fetch_add(1, std::memory_order_relaxed);
            const uint32_t delay_ms = constants::kNvsRetryDelayMs << attempt;
            ESP_LOGW(TAG, "NVS operation failed (attempt %u/%u), retrying in %ums",
                     static_cast<unsigned>(attempt + 1),
                     static_cast<unsigned>(constants::kNvsMaxRetries),
                     static_cast<unsigned>(delay_ms));
            vTaskDelay(pdMS_TO_TICKS(delay_ms));
        }
    }

    return err;
}

// =============================================================================
// Config Manager
// =============================================================================

ConfigManager& ConfigManager::instance()
{
    static ConfigManager instance;
    return instance;
}

esp_err_t ConfigManager::init()
{
    if (initialized_.load(std::memory_order_acquire)) {
        ESP_LOGW(TAG, "Already initialized");
        return ESP_OK;
    }

    mutex_ = xSemaphoreCreateMutex();
    if (mutex_ == nullptr) {
        ESP_LOGE(TAG, "Failed to create mutex");
        return ESP_ERR_NO_MEM;
    }

    apply_defaults(config_);

    ancs_bridge_config_t loaded{};
    esp_err_t err = persister_.load(loaded);

    if (err == ESP_OK) {
        auto validation = validate(loaded);
        if (validation.valid) {
            config_ = loaded;
        } else {
            ESP_LOGW(TAG, "Stored config rejected (%s), using defaults",
                     validation.error_message.c_str());
            validation_failures_.fetch_add(1, std::memory_order_relaxed);
            err = persister_.save(config_);
        }
    } else {
        ESP_LOGI(TAG, "No valid config in NVS, using defaults");
        err = persister_.save(config_);
    }

    initialized_.store(true, std::memory_order_release);

    ESP_LOGI(TAG, "Configuration Manager initialized");
    ESP_LOGI(TAG, "  attribute timeout: %u ms x%u",
             static_cast<unsigned>(config_.attribute_timeout_ms),
             static_cast<unsigned>(config_.attribute_retries) + 1);
    ESP_LOGI(TAG, "  reconnect: %u..%u ms, %u attempts",
             static_cast<unsigned>(config_.reconnect_base_delay_ms),
             static_cast<unsigned>(config_.reconnect_max_delay_ms),
             static_cast<unsigned>(config_.max_reconnect_attempts));
    ESP_LOGI(TAG, "  last device: %s%s", config_.device_address[0] ? config_.device_address : "(none)",
             config_.auto_connect_on_boot ? " (auto-connect)" : "");

    return err;
}

void ConfigManager::apply_defaults(ancs_bridge_config_t& cfg)
{
    std::memset(&cfg, 0, sizeof(cfg));

    const ancs::EngineConfig engine;
    cfg.version = constants::kConfigVersion;
    cfg.attribute_timeout_ms = engine.attribute_timeout_ms;
    cfg.attribute_retries = engine.attribute_retries;
    cfg.connect_timeout_ms = engine.connect_timeout_ms;
    cfg.auto_reconnect = engine.auto_reconnect;
    cfg.reconnect_base_delay_ms = engine.reconnect_base_delay_ms;
    cfg.reconnect_max_delay_ms = engine.reconnect_max_delay_ms;
    cfg.max_reconnect_attempts = engine.max_reconnect_attempts;
    cfg.title_max_length = engine.title_max_length;
    cfg.subtitle_max_length = engine.subtitle_max_length;
    cfg.message_max_length = engine.message_max_length;
    cfg.backlog_capacity = engine.backlog_capacity;
    cfg.drain_policy = ANCS_DRAIN_DELIVER_UNENRICHED;
    cfg.ignore_pre_existing = engine.ignore_pre_existing;
    cfg.ignore_silent = engine.ignore_silent;
    cfg.auto_connect_on_boot = true;
}

ancs_bridge_config_t ConfigManager::get() const
{
    ScopedMutex lock(mutex_);
    if (!lock.is_locked()) {
        ESP_LOGW(TAG, "Failed to acquire mutex for get()");
        ancs_bridge_config_t fallback;
        apply_defaults(fallback);
        return fallback;
    }
    return config_;
}

esp_err_t ConfigManager::set(const ancs_bridge_config_t& cfg, bool persist)
{
    auto validation = validate(cfg);
    if (!validation.valid) {
        ESP_LOGE(TAG, "Configuration validation failed: %s", validation.error_message.c_str());
        validation_failures_.fetch_add(1, std::memory_order_relaxed);
        return ESP_ERR_INVALID_ARG;
    }

    ScopedMutex lock(mutex_);
    if (!lock.is_locked()) {
        ESP_LOGW(TAG, "Failed to acquire mutex for set()");
        return ESP_ERR_TIMEOUT;
    }

    if (std::memcmp(&config_, &cfg, sizeof(cfg)) == 0) {
        ESP_LOGD(TAG, "Configuration unchanged, skipping update");
        return ESP_OK;
    }

    const ancs_bridge_config_t previous = config_;
    config_ = cfg;
    dirty_.store(true, std::memory_order_release);

    if (persist) {
        const esp_err_t err = persister_.save(cfg);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Failed to persist config, rolling back");
            config_ = previous;
            dirty_.store(false, std::memory_order_release);
            return err;
        }
        dirty_.store(false, std::memory_order_release);
    }

    lock.unlock();
    observer_manager_.notify_all(cfg);
    return ESP_OK;
}

ancs::EngineConfig ConfigManager::engine_config() const
{
    return to_engine_config(get());
}

std::optional<ancs::DeviceHandle> ConfigManager::last_device() const
{
    const ancs_bridge_config_t cfg = get();
    if (cfg.device_address[0] == '\0') {
        return std::nullopt;
    }

    ancs::DeviceHandle device;
    device.address = cfg.device_address;
    device.address_type = cfg.device_address_type;
    device.name = cfg.device_name;
    return device;
}

bool ConfigManager::auto_connect_on_boot() const
{
    return get().auto_connect_on_boot;
}

esp_err_t ConfigManager::set_last_device(const ancs::DeviceHandle& device)
{
    if (device.address.size() >= ANCS_CFG_ADDRESS_SIZE ||
        !ancs::Validator::is_valid_device_address(device.address)) {
        return ESP_ERR_INVALID_ARG;
    }

    ancs_bridge_config_t cfg = get();
    strlcpy(cfg.device_address, device.address.c_str(), sizeof(cfg.device_address));
    strlcpy(cfg.device_name, device.name.c_str(), sizeof(cfg.device_name));
    cfg.device_address_type = device.address_type;
    return set(cfg);
}

esp_err_t ConfigManager::forget_device()
{
    ancs_bridge_config_t cfg = get();
    std::memset(cfg.device_address, 0, sizeof(cfg.device_address));
    std::memset(cfg.device_name, 0, sizeof(cfg.device_name));
    cfg.device_address_type = 0;
    return set(cfg);
}

esp_err_t ConfigManager::set_auto_connect_on_boot(bool enabled)
{
    ancs_bridge_config_t cfg = get();
    cfg.auto_connect_on_boot = enabled;
    return set(cfg);
}

void ConfigManager::add_callback(ConfigObserverCallback callback)
{
    observer_manager_.add_callback(std::move(callback));
}

ConfigManager::Stats ConfigManager::get_stats() const
{
    return {
        .saves = persister_.save_count(),
        .loads = persister_.load_count(),
        .retries = persister_.retry_count(),
        .validation_failures = validation_failures_.load(std::memory_order_relaxed),
        .dirty = dirty_.load(std::memory_order_acquire),
    };
}

} // namespace config

// =============================================================================
// C API
// =============================================================================

extern "C" {

esp_err_t config_manager_init(void)
{
    return config::ConfigManager::instance().init();
}

esp_err_t config_manager_save(const ancs_bridge_config_t* cfg)
{
    if (cfg == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    return config::ConfigManager::instance().set(*cfg, true);
}

const ancs_bridge_config_t* config_manager_get(void)
{
    static thread_local ancs_bridge_config_t cached_config;
    cached_config = config::ConfigManager::instance().get();
    return &cached_config;
}

esp_err_t config_manager_set_last_device(const char* address, uint8_t address_type, const char* name)
{
    if (address == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    ancs::DeviceHandle device;
    device.address = address;
    device.address_type = address_type;
    device.name = name != nullptr ? name : "";
    return config::ConfigManager::instance().set_last_device(device);
}

esp_err_t config_manager_forget_device(void)
{
    return config::ConfigManager::instance().forget_device();
}

} // extern "C"
