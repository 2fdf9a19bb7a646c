#include "notification_record.hpp"

namespace ancs {

namespace {

void assign_if_present(const AttributeMap& attributes, AttributeId id,
                       std::optional<std::string>& field)
{
    auto it = attributes.find(id);
    if (it != attributes.end()) {
        field = it->second;
    }
}

} // anonymous namespace

const char* enrichment_status_name(EnrichmentStatus status)
{
    switch (status) {
        case EnrichmentStatus::NotRequested: return "NotRequested";
        case EnrichmentStatus::Pending:      return "Pending";
        case EnrichmentStatus::Enriched:     return "Enriched";
        case EnrichmentStatus::Unavailable:  return "Unavailable";
    }
    return "Unknown";
}

bool is_important_notification(uint8_t event_flags, uint8_t category_id)
{
    return (event_flags & event_flags::kImportant) != 0 ||
           category_id == static_cast<uint8_t>(CategoryId::IncomingCall);
}

NotificationRecord make_notification_record(uint64_t id,
                                            const NotificationSourceEvent& event,
                                            int64_t timestamp_ms)
{
    NotificationRecord record;
    record.id = id;
    record.event_id = event.event_id;
    record.event_flags = event.event_flags;
    record.category_id = event.category_id;
    record.category_count = event.category_count;
    record.notification_uid = event.notification_uid;
    record.timestamp_ms = timestamp_ms;
    record.category_name = category_name(event.category_id);
    record.is_important = is_important_notification(event.event_flags, event.category_id);
    record.enrichment = event.event_id == EventId::Removed ? EnrichmentStatus::NotRequested
                                                           : EnrichmentStatus::Pending;
    return record;
}

void apply_attributes(NotificationRecord& record, const AttributeMap& attributes)
{
    assign_if_present(attributes, AttributeId::AppIdentifier, record.app_identifier);
    assign_if_present(attributes, AttributeId::Title, record.title);
    assign_if_present(attributes, AttributeId::Subtitle, record.subtitle);
    assign_if_present(attributes, AttributeId::Message, record.message);
    assign_if_present(attributes, AttributeId::Date, record.date);
    record.enrichment = EnrichmentStatus::Enriched;
}

void mark_unavailable(NotificationRecord& record)
{
    record.enrichment = EnrichmentStatus::Unavailable;
}

std::string display_text(const NotificationRecord& record)
{
    if (record.enrichment == EnrichmentStatus::Unavailable) {
        return std::string(kContentUnavailable);
    }
    if (record.title && !record.title->empty()) {
        return *record.title;
    }
    if (record.message && !record.message->empty()) {
        return *record.message;
    }
    return record.category_name;
}

} // namespace ancs
