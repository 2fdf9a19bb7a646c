/**
 * @file bus_payloads.hpp
 * @brief Engine events to the fixed-size C payloads of event_types.h
 *
 * Strings longer than their field are cut on a UTF-8 character boundary
 * and always NUL terminated.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "engine_events.hpp"
#include "gatt_transport.hpp"
#include "notification_record.hpp"

extern "C" {
#include "event_types.h"
}

namespace ancs_service {

/**
 * @return bytes written, excluding the terminator
 */
size_t copy_truncated(char* dst, size_t dst_size, std::string_view src);

ancs_enrichment_t to_bus_enrichment(ancs::EnrichmentStatus status);
ancs_link_state_t to_bus_link_state(ancs::ConnectionState state);

ancs_notification_event_t make_notification_payload(const ancs::NotificationRecord& record,
                                                    ancs::Error outcome);

ancs_notification_removed_t make_removed_payload(const ancs::NotificationRecord& record);

ancs_connection_event_t make_connection_payload(ancs::ConnectionState state,
                                                const std::optional<ancs::DeviceHandle>& device,
                                                ancs::Error reason);

ancs_reconnect_exhausted_t make_exhausted_payload(const std::optional<std::string>& device_name,
                                                  uint32_t attempts);

/**
 * @brief Parsed attribute set as compact JSON, keyed by attribute name
 */
std::string attributes_to_json(const ancs::AttributeMap& attributes);

/**
 * @brief Delivered record as compact JSON, absent attributes omitted
 */
std::string record_to_json(const ancs::NotificationRecord& record);

} // namespace ancs_service
