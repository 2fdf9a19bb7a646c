// main/app_main.cpp
#include <cstdlib>

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "nvs_flash.h"
#include "sdkconfig.h"

#include "ancs_service.h"
#include "config_manager.h"
#include "config_manager_core.hpp"
#include "diagnostic_logger.h"
#include "event_bus.h"
#include "event_types.h"

static const char *TAG = "ANCS_MAIN";

#ifndef EVENT_BUS_TASK_STACK_SIZE
#define EVENT_BUS_TASK_STACK_SIZE 5120
#endif

#ifndef EVENT_BUS_TASK_PRIORITY
#define EVENT_BUS_TASK_PRIORITY 6
#endif

static event_bus_t s_event_bus;

static esp_err_t init_nvs(void) {
  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES ||
      err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_LOGW(TAG, "NVS partition needs erasing (%s)", esp_err_to_name(err));
    ESP_ERROR_CHECK(nvs_flash_erase());
    err = nvs_flash_init();
  }
  return err;
}

static void create_core_tasks(void) {
  BaseType_t rc;

#ifdef CONFIG_FREERTOS_UNICORE
  rc = xTaskCreate(event_bus_dispatch_task, "event_dispatch",
                   EVENT_BUS_TASK_STACK_SIZE, &s_event_bus,
                   EVENT_BUS_TASK_PRIORITY, NULL);
#else
  rc = xTaskCreatePinnedToCore(event_bus_dispatch_task, "event_dispatch",
                               EVENT_BUS_TASK_STACK_SIZE, &s_event_bus,
                               EVENT_BUS_TASK_PRIORITY, NULL, tskNO_AFFINITY);
#endif

  if (rc != pdPASS) {
    ESP_LOGE(TAG,
             "CRITICAL: Failed to start event dispatch task (rc=%ld). System "
             "halted.",
             (long)rc);
    abort();
  }
}

static void publish_config_update(const ancs_bridge_config_t &cfg) {
  event_t evt = {};
  evt.type = EVENT_CONFIG_UPDATED;
  evt.data = const_cast<ancs_bridge_config_t *>(&cfg);
  evt.data_size = sizeof(cfg);
  if (!event_bus_publish(&s_event_bus, &evt)) {
    ESP_LOGW(TAG, "Config update not published");
  }
}

extern "C" void app_main(void) {
  ESP_LOGI(TAG, "Starting ANCS bridge");

  // 1) Flash storage for config, bonds and the diagnostic ring
  ESP_ERROR_CHECK(init_nvs());

  // 2) EventBus
  event_bus_init(&s_event_bus);
  if (s_event_bus.impl_data == NULL) {
    ESP_LOGE(TAG, "CRITICAL: EventBus unavailable. System halted.");
    abort();
  }

  // 3) Persistent configuration
  esp_err_t err = config_manager_init();
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "Config not persisted (%s), running on defaults",
             esp_err_to_name(err));
  }
  config::ConfigManager::instance().add_callback(publish_config_update);

  // 4) Diagnostic ring (link and notification history)
  err = diagnostic_logger_init(&s_event_bus);
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "Diagnostic logger disabled: %s", esp_err_to_name(err));
  }

  // 5) ANCS client
  err = ancs_service_init(&s_event_bus);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "ANCS service init failed: %s", esp_err_to_name(err));
    diagnostic_logger_append(DIAG_LOG_SOURCE_MAIN, "ancs service init failed");
    create_core_tasks();
    return;
  }

  create_core_tasks();

  err = ancs_service_start();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "ANCS service start failed: %s", esp_err_to_name(err));
    diagnostic_logger_append(DIAG_LOG_SOURCE_MAIN, "ancs service start failed");
    return;
  }

  diagnostic_logger_append(DIAG_LOG_SOURCE_MAIN, "boot complete");
  ESP_LOGI(TAG, "ANCS bridge running");
}
