// components/event_bus/event_bus.h
#ifndef EVENT_BUS_H
#define EVENT_BUS_H

#include <stdbool.h>
#include <stdint.h>
#include <stddef.h>

#include "event_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Event published on the bus
 *
 * data points to one of the payload structs of event_types.h. The bus
 * copies data_size bytes on publish, so the publisher may reuse its
 * buffer as soon as event_bus_publish() returns.
 */
typedef struct {
    event_type_t type;
    void        *data;
    size_t       data_size;
} event_t;

/**
 * @brief Bus handle; impl_data holds the C++ implementation
 */
struct event_bus {
    void *impl_data;
};

typedef struct event_bus event_bus_t;

/**
 * @brief Subscriber callback, run on the dispatch task
 */
typedef void (*event_callback_t)(event_bus_t *bus, const event_t *event, void *user_ctx);

typedef struct {
    uint32_t subscribers;
    uint32_t published_total;
} event_bus_metrics_t;

typedef struct {
    uint32_t queue_capacity;
    uint32_t messages_waiting;
    uint32_t dropped_events;
} event_bus_queue_metrics_t;

void event_bus_init(event_bus_t *bus);

/**
 * @brief Register @p callback for events of @p type
 *
 * @return true on success
 */
bool event_bus_subscribe(event_bus_t *bus,
                         event_type_t type,
                         event_callback_t callback,
                         void *user_ctx);

/**
 * @brief Remove the subscription registered with the same triple
 */
bool event_bus_unsubscribe(event_bus_t *bus,
                           event_type_t type,
                           event_callback_t callback,
                           void *user_ctx);

/**
 * @brief Queue an event for the dispatch task
 *
 * @return false when the bus is not initialized, the queue is full or
 *         the payload could not be copied
 */
bool event_bus_publish(event_bus_t *bus, const event_t *event);

event_bus_metrics_t event_bus_get_metrics(const event_bus_t *bus);

bool event_bus_get_queue_metrics(const event_bus_t *bus, event_bus_queue_metrics_t *out);

/**
 * @brief FreeRTOS task body; @p ctx is the event_bus_t to serve
 */
void event_bus_dispatch_task(void *ctx);

#ifdef __cplusplus
}
#endif

#endif // EVENT_BUS_H
