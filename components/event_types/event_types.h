#ifndef EVENT_TYPES_H
#define EVENT_TYPES_H

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Fixed sizes of the strings carried by bus payloads. Longer values are
 * truncated on the bus; the engine itself keeps them whole.
 */
#define ANCS_EVENT_ADDRESS_MAX      18
#define ANCS_EVENT_DEVICE_NAME_MAX  32
#define ANCS_EVENT_CATEGORY_MAX     24
#define ANCS_EVENT_APP_ID_MAX       64
#define ANCS_EVENT_APP_NAME_MAX     32
#define ANCS_EVENT_TITLE_MAX        64
#define ANCS_EVENT_SUBTITLE_MAX     64
#define ANCS_EVENT_MESSAGE_MAX      256
#define ANCS_EVENT_DATE_MAX         16

/**
 * ===========================================================
 *  EVENTS PUBLISHED ON THE EVENT BUS
 * ===========================================================
 */

typedef enum {
    EVENT_TYPE_NONE = 0,

    // --- ANCS service ---
    EVENT_ANCS_NOTIFICATION_RECEIVED,   // ancs_notification_event_t
    EVENT_ANCS_NOTIFICATION_REMOVED,    // ancs_notification_removed_t
    EVENT_ANCS_CONNECTION_CHANGED,      // ancs_connection_event_t
    EVENT_ANCS_RECONNECT_EXHAUSTED,     // ancs_reconnect_exhausted_t

    // --- Local configuration ---
    EVENT_CONFIG_UPDATED,               // ancs_bridge_config_t

    EVENT_TYPE_MAX
} event_type_t;

/**
 * ===========================================================
 *  PAYLOADS
 * ===========================================================
 */

typedef enum {
    ANCS_LINK_DISCONNECTED = 0,
    ANCS_LINK_CONNECTING,
    ANCS_LINK_CONNECTED,
} ancs_link_state_t;

typedef enum {
    ANCS_ENRICHMENT_NOT_REQUESTED = 0,
    ANCS_ENRICHMENT_PENDING,
    ANCS_ENRICHMENT_ENRICHED,
    ANCS_ENRICHMENT_UNAVAILABLE,
} ancs_enrichment_t;

/**
 * Bits of ancs_notification_event_t::present_mask, one per attribute id.
 * A present attribute may still be an empty string.
 */
#define ANCS_ATTR_PRESENT_APP_ID      (1u << 0)
#define ANCS_ATTR_PRESENT_TITLE       (1u << 1)
#define ANCS_ATTR_PRESENT_SUBTITLE    (1u << 2)
#define ANCS_ATTR_PRESENT_MESSAGE     (1u << 3)
#define ANCS_ATTR_PRESENT_DATE        (1u << 5)

/**
 * @brief Notification added or modified on the phone
 *
 * result is the engine status code: 0 when the record was enriched,
 * otherwise why the content is unavailable.
 */
typedef struct {
    uint64_t          id;
    uint32_t          notification_uid;
    int64_t           timestamp_ms;
    uint8_t           event_id;         // 0 added, 1 modified
    uint8_t           event_flags;
    uint8_t           category_id;
    uint8_t           category_count;
    bool              is_important;
    ancs_enrichment_t enrichment;
    uint8_t           result;
    uint8_t           present_mask;

    char category_name[ANCS_EVENT_CATEGORY_MAX];
    char app_identifier[ANCS_EVENT_APP_ID_MAX];
    char app_display_name[ANCS_EVENT_APP_NAME_MAX];
    char title[ANCS_EVENT_TITLE_MAX];
    char subtitle[ANCS_EVENT_SUBTITLE_MAX];
    char message[ANCS_EVENT_MESSAGE_MAX];
    char date[ANCS_EVENT_DATE_MAX];
} ancs_notification_event_t;

typedef struct {
    uint32_t notification_uid;
    int64_t  timestamp_ms;
    uint8_t  category_id;
    char     category_name[ANCS_EVENT_CATEGORY_MAX];
} ancs_notification_removed_t;

typedef struct {
    ancs_link_state_t state;
    uint8_t           reason;           // engine status code, 0 when requested
    uint8_t           address_type;
    char              address[ANCS_EVENT_ADDRESS_MAX];
    char              device_name[ANCS_EVENT_DEVICE_NAME_MAX];
} ancs_connection_event_t;

typedef struct {
    uint32_t attempts;
    char     device_name[ANCS_EVENT_DEVICE_NAME_MAX];
} ancs_reconnect_exhausted_t;

#ifdef __cplusplus
}
#endif

#endif // EVENT_TYPES_H
