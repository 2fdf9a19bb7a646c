#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include "esp_err.h"
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define ANCS_CFG_ADDRESS_SIZE 18
#define ANCS_CFG_NAME_SIZE    32

typedef enum {
    ANCS_DRAIN_DELIVER_UNENRICHED = 0,
    ANCS_DRAIN_DISCARD            = 1,
} ancs_drain_policy_t;

/**
 * Persisted firmware configuration: engine tunables plus the phone last
 * connected, used to reconnect at boot.
 */
typedef struct {
    uint32_t version;

    uint32_t attribute_timeout_ms;
    uint32_t connect_timeout_ms;
    uint32_t reconnect_base_delay_ms;
    uint32_t reconnect_max_delay_ms;
    uint32_t max_reconnect_attempts;
    uint32_t backlog_capacity;
    uint16_t title_max_length;
    uint16_t subtitle_max_length;
    uint16_t message_max_length;
    uint8_t  attribute_retries;
    uint8_t  drain_policy;          // ancs_drain_policy_t
    bool     auto_reconnect;
    bool     ignore_pre_existing;
    bool     ignore_silent;

    char     device_address[ANCS_CFG_ADDRESS_SIZE];
    char     device_name[ANCS_CFG_NAME_SIZE];
    uint8_t  device_address_type;
    bool     auto_connect_on_boot;
} ancs_bridge_config_t;

esp_err_t config_manager_init(void);

esp_err_t config_manager_save(const ancs_bridge_config_t *cfg);

const ancs_bridge_config_t *config_manager_get(void);

/**
 * @brief Remember @p address as the phone to reconnect to at boot
 */
esp_err_t config_manager_set_last_device(const char *address,
                                         uint8_t address_type,
                                         const char *name);

esp_err_t config_manager_forget_device(void);

#ifdef __cplusplus
}
#endif

#endif // CONFIG_MANAGER_H
