/**
 * @file notification_record.hpp
 * @brief One ANCS notification occurrence as delivered to consumers
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ancs_protocol.hpp"
#include "attribute_reassembler.hpp"

namespace ancs {

constexpr std::string_view kContentUnavailable = "Content unavailable";

enum class EnrichmentStatus : uint8_t {
    NotRequested, // Removed events
    Pending,
    Enriched,
    Unavailable,  // fetch timed out, failed or was cut by a disconnect
};

const char* enrichment_status_name(EnrichmentStatus status);

struct NotificationRecord {
    uint64_t id{0};
    EventId event_id{EventId::Added};
    uint8_t event_flags{0};
    uint8_t category_id{0};
    uint8_t category_count{0};
    uint32_t notification_uid{0};
    int64_t timestamp_ms{0};
    std::string category_name;
    bool is_important{false};

    std::optional<std::string> app_identifier;
    std::optional<std::string> app_display_name;
    std::optional<std::string> title;
    std::optional<std::string> subtitle;
    std::optional<std::string> message;
    std::optional<std::string> date;

    EnrichmentStatus enrichment{EnrichmentStatus::Pending};

    bool is_silent() const { return (event_flags & event_flags::kSilent) != 0; }
    bool is_pre_existing() const { return (event_flags & event_flags::kPreExisting) != 0; }
    bool has_positive_action() const { return (event_flags & event_flags::kPositiveAction) != 0; }
    bool has_negative_action() const { return (event_flags & event_flags::kNegativeAction) != 0; }
};

/**
 * @brief Important flag set, or the category is Incoming Call
 */
bool is_important_notification(uint8_t event_flags, uint8_t category_id);

NotificationRecord make_notification_record(uint64_t id,
                                            const NotificationSourceEvent& event,
                                            int64_t timestamp_ms);

/**
 * @brief Copy the received attributes into the record
 *
 * Attributes missing from @p attributes stay unset. Marks the record
 * Enriched.
 */
void apply_attributes(NotificationRecord& record, const AttributeMap& attributes);

void mark_unavailable(NotificationRecord& record);

/**
 * @brief Best single line for display: title, then message, then the
 *        category name; the unavailable sentinel when enrichment failed.
 */
std::string display_text(const NotificationRecord& record);

} // namespace ancs
