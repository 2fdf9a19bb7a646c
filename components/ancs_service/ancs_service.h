#ifndef ANCS_SERVICE_H
#define ANCS_SERVICE_H

#include "esp_err.h"
#include "event_bus.h"
#include "event_types.h"
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Snapshot of the ANCS client: link, counters and last error.
 * Error fields hold engine status codes (0 = none).
 */
typedef struct {
    bool              initialized;
    bool              connected;
    ancs_link_state_t state;
    uint8_t           address_type;
    char              address[ANCS_EVENT_ADDRESS_MAX];
    char              device_name[ANCS_EVENT_DEVICE_NAME_MAX];

    int64_t  last_event_time_ms;
    uint8_t  last_error;

    uint32_t notification_count;
    uint32_t removed_count;
    uint32_t malformed_packets;
    uint32_t filtered_count;

    uint32_t commands_written;
    uint32_t retries;
    uint32_t timeouts;
    uint32_t protocol_errors;
    uint32_t write_failures;
    uint32_t enriched;
    uint32_t degraded;
    uint32_t drained;

    uint32_t connect_attempts;
    uint32_t connect_failures;
    uint32_t drops;
    uint32_t reconnects_scheduled;

    uint32_t bus_publish_failures;
} ancs_service_status_t;

/**
 * @brief Create the transport, timers and engine from the stored config
 */
esp_err_t ancs_service_init(event_bus_t *bus);

/**
 * @brief Start the BLE host; reconnects to the stored phone when enabled
 */
esp_err_t ancs_service_start(void);

esp_err_t ancs_service_connect(const char *address, uint8_t address_type, const char *name);

esp_err_t ancs_service_disconnect(void);

/**
 * @brief Disconnect and stop the engine for good
 */
esp_err_t ancs_service_shutdown(void);

ancs_service_status_t ancs_service_get_status(void);

#ifdef __cplusplus
}
#endif

#endif // ANCS_SERVICE_H
