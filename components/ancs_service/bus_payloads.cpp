/**
 * @file bus_payloads.cpp
 * @brief Engine events to bus payloads and JSON renderings
 */

#include "bus_payloads.hpp"

#include <cstring>
#include <memory>

#include "cJSON.h"

namespace ancs_service {

namespace {

struct CJsonDeleter {
    void operator()(cJSON* ptr) const noexcept
    {
        if (ptr != nullptr) {
            cJSON_Delete(ptr);
        }
    }
};

using UniqueCJson = std::unique_ptr<cJSON, CJsonDeleter>;

struct CStringDeleter {
    void operator()(char* ptr) const noexcept
    {
        if (ptr != nullptr) {
            cJSON_free(ptr);
        }
    }
};

using UniqueCString = std::unique_ptr<char, CStringDeleter>;

std::string render(const UniqueCJson& root)
{
    if (!root) {
        return {};
    }
    UniqueCString rendered(cJSON_PrintUnformatted(root.get()));
    return rendered ? std::string(rendered.get()) : std::string();
}

void add_optional(cJSON* obj, const char* key, const std::optional<std::string>& value)
{
    if (value) {
        cJSON_AddStringToObject(obj, key, value->c_str());
    }
}

} // anonymous namespace

size_t copy_truncated(char* dst, size_t dst_size, std::string_view src)
{
    if (dst == nullptr || dst_size == 0) {
        return 0;
    }

    size_t len = src.size() < dst_size - 1 ? src.size() : dst_size - 1;
    if (len < src.size()) {
        // Back off to the start of the cut character
        while (len > 0 && (static_cast<uint8_t>(src[len]) & 0xC0) == 0x80) {
            --len;
        }
    }

    std::memcpy(dst, src.data(), len);
    dst[len] = '\0';
    return len;
}

ancs_enrichment_t to_bus_enrichment(ancs::EnrichmentStatus status)
{
    switch (status) {
        case ancs::EnrichmentStatus::NotRequested: return ANCS_ENRICHMENT_NOT_REQUESTED;
        case ancs::EnrichmentStatus::Pending:      return ANCS_ENRICHMENT_PENDING;
        case ancs::EnrichmentStatus::Enriched:     return ANCS_ENRICHMENT_ENRICHED;
        case ancs::EnrichmentStatus::Unavailable:  return ANCS_ENRICHMENT_UNAVAILABLE;
    }
    return ANCS_ENRICHMENT_UNAVAILABLE;
}

ancs_link_state_t to_bus_link_state(ancs::ConnectionState state)
{
    switch (state) {
        case ancs::ConnectionState::Connecting: return ANCS_LINK_CONNECTING;
        case ancs::ConnectionState::Connected:  return ANCS_LINK_CONNECTED;
        case ancs::ConnectionState::Disconnected:
        default:
            return ANCS_LINK_DISCONNECTED;
    }
}

ancs_notification_event_t make_notification_payload(const ancs::NotificationRecord& record,
                                                    ancs::Error outcome)
{
    ancs_notification_event_t out;
    std::memset(&out, 0, sizeof(out));

    out.id = record.id;
    out.notification_uid = record.notification_uid;
    out.timestamp_ms = record.timestamp_ms;
    out.event_id = static_cast<uint8_t>(record.event_id);
    out.event_flags = record.event_flags;
    out.category_id = record.category_id;
    out.category_count = record.category_count;
    out.is_important = record.is_important;
    out.enrichment = to_bus_enrichment(record.enrichment);
    out.result = static_cast<uint8_t>(outcome);

    copy_truncated(out.category_name, sizeof(out.category_name), record.category_name);

    if (record.app_identifier) {
        out.present_mask |= ANCS_ATTR_PRESENT_APP_ID;
        copy_truncated(out.app_identifier, sizeof(out.app_identifier), *record.app_identifier);
    }
    if (record.app_display_name) {
        copy_truncated(out.app_display_name, sizeof(out.app_display_name), *record.app_display_name);
    }
    if (record.title) {
        out.present_mask |= ANCS_ATTR_PRESENT_TITLE;
        copy_truncated(out.title, sizeof(out.title), *record.title);
    }
    if (record.subtitle) {
        out.present_mask |= ANCS_ATTR_PRESENT_SUBTITLE;
        copy_truncated(out.subtitle, sizeof(out.subtitle), *record.subtitle);
    }
    if (record.message) {
        out.present_mask |= ANCS_ATTR_PRESENT_MESSAGE;
        copy_truncated(out.message, sizeof(out.message), *record.message);
    }
    if (record.date) {
        out.present_mask |= ANCS_ATTR_PRESENT_DATE;
        copy_truncated(out.date, sizeof(out.date), *record.date);
    }

    // Consumers without attribute handling still get something to show
    if (record.enrichment == ancs::EnrichmentStatus::Unavailable && !record.message) {
        copy_truncated(out.message, sizeof(out.message), ancs::kContentUnavailable);
    }

    return out;
}

ancs_notification_removed_t make_removed_payload(const ancs::NotificationRecord& record)
{
    ancs_notification_removed_t out;
    std::memset(&out, 0, sizeof(out));

    out.notification_uid = record.notification_uid;
    out.timestamp_ms = record.timestamp_ms;
    out.category_id = record.category_id;
    copy_truncated(out.category_name, sizeof(out.category_name), record.category_name);
    return out;
}

ancs_connection_event_t make_connection_payload(ancs::ConnectionState state,
                                                const std::optional<ancs::DeviceHandle>& device,
                                                ancs::Error reason)
{
    ancs_connection_event_t out;
    std::memset(&out, 0, sizeof(out));

    out.state = to_bus_link_state(state);
    out.reason = static_cast<uint8_t>(reason);
    if (device) {
        out.address_type = device->address_type;
        copy_truncated(out.address, sizeof(out.address), device->address);
        copy_truncated(out.device_name, sizeof(out.device_name), device->name);
    }
    return out;
}

ancs_reconnect_exhausted_t make_exhausted_payload(const std::optional<std::string>& device_name,
                                                  uint32_t attempts)
{
    ancs_reconnect_exhausted_t out;
    std::memset(&out, 0, sizeof(out));

    out.attempts = attempts;
    if (device_name) {
        copy_truncated(out.device_name, sizeof(out.device_name), *device_name);
    }
    return out;
}

std::string attributes_to_json(const ancs::AttributeMap& attributes)
{
    UniqueCJson root(cJSON_CreateObject());
    if (!root) {
        return {};
    }

    for (const auto& [id, value] : attributes) {
        cJSON_AddStringToObject(root.get(), ancs::attribute_name(id), value.c_str());
    }
    return render(root);
}

std::string record_to_json(const ancs::NotificationRecord& record)
{
    UniqueCJson root(cJSON_CreateObject());
    if (!root) {
        return {};
    }

    cJSON* obj = root.get();
    cJSON_AddNumberToObject(obj, "id", static_cast<double>(record.id));
    cJSON_AddNumberToObject(obj, "uid", static_cast<double>(record.notification_uid));
    cJSON_AddStringToObject(obj, "event", ancs::event_id_name(record.event_id));
    cJSON_AddStringToObject(obj, "category", record.category_name.c_str());
    cJSON_AddNumberToObject(obj, "categoryCount", record.category_count);
    cJSON_AddBoolToObject(obj, "important", record.is_important);
    cJSON_AddBoolToObject(obj, "silent", record.is_silent());
    cJSON_AddBoolToObject(obj, "preExisting", record.is_pre_existing());
    cJSON_AddStringToObject(obj, "enrichment", ancs::enrichment_status_name(record.enrichment));

    add_optional(obj, "appIdentifier", record.app_identifier);
    add_optional(obj, "appDisplayName", record.app_display_name);
    add_optional(obj, "title", record.title);
    add_optional(obj, "subtitle", record.subtitle);
    add_optional(obj, "message", record.message);
    add_optional(obj, "date", record.date);

    return render(root);
}

} // namespace ancs_service
