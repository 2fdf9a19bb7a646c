#include <cstring>
#include <string>

#include "bus_payloads.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace ancs_service;

namespace {
ancs::NotificationRecord make_record()
{
    ancs::NotificationRecord record;
    record.id = 7;
    record.notification_uid = 42;
    record.timestamp_ms = 1000;
    record.category_id = 4;
    record.category_name = "Social";
    record.category_count = 2;
    record.event_flags = 0x02;
    record.is_important = true;
    return record;
}
}  // namespace

TEST_CASE("copy_truncated never splits a UTF-8 character")
{
    char buf[3];
    // "h" + U+00E9 (2 bytes) + "llo": the cut lands inside the second byte
    CHECK(copy_truncated(buf, sizeof(buf), "h\xC3\xA9llo") == 1);
    CHECK(std::string(buf) == "h");

    char wide[4];
    CHECK(copy_truncated(wide, sizeof(wide), "h\xC3\xA9llo") == 3);
    CHECK(std::string(wide) == "h\xC3\xA9");
}

TEST_CASE("copy_truncated fits short strings and handles degenerate buffers")
{
    char buf[8];
    std::memset(buf, 'x', sizeof(buf));
    CHECK(copy_truncated(buf, sizeof(buf), "abc") == 3);
    CHECK(std::string(buf) == "abc");

    CHECK(copy_truncated(buf, 1, "abc") == 0);
    CHECK(buf[0] == '\0');
    CHECK(copy_truncated(nullptr, 4, "abc") == 0);
}

TEST_CASE("enriched notification sets one present bit per received attribute")
{
    auto record = make_record();
    record.app_identifier = "com.apple.MobileSMS";
    record.app_display_name = "Messages";
    record.title = "Alice";
    record.subtitle = "";
    record.message = "See you at 8";
    record.enrichment = ancs::EnrichmentStatus::Enriched;

    const auto payload = make_notification_payload(record, ancs::Error::Ok);
    CHECK(payload.id == 7);
    CHECK(payload.notification_uid == 42);
    CHECK(payload.category_id == 4);
    CHECK(payload.category_count == 2);
    CHECK(payload.is_important);
    CHECK(payload.enrichment == ANCS_ENRICHMENT_ENRICHED);
    CHECK(payload.result == 0);
    CHECK(payload.present_mask == (ANCS_ATTR_PRESENT_APP_ID | ANCS_ATTR_PRESENT_TITLE |
                                   ANCS_ATTR_PRESENT_SUBTITLE | ANCS_ATTR_PRESENT_MESSAGE));
    CHECK(std::string(payload.category_name) == "Social");
    CHECK(std::string(payload.app_display_name) == "Messages");
    CHECK(std::string(payload.title) == "Alice");
    CHECK(std::string(payload.subtitle).empty());
    CHECK(std::string(payload.message) == "See you at 8");
    CHECK(std::string(payload.date).empty());
}

TEST_CASE("unavailable notification carries the reason and the fallback text")
{
    auto record = make_record();
    record.enrichment = ancs::EnrichmentStatus::Unavailable;

    const auto payload = make_notification_payload(record, ancs::Error::MaxRetriesExceeded);
    CHECK(payload.enrichment == ANCS_ENRICHMENT_UNAVAILABLE);
    CHECK(payload.result == static_cast<uint8_t>(ancs::Error::MaxRetriesExceeded));
    CHECK(payload.present_mask == 0);
    CHECK(std::string(payload.message) == std::string(ancs::kContentUnavailable));
}

TEST_CASE("removed payload keeps the envelope only")
{
    auto record = make_record();
    record.event_id = ancs::EventId::Removed;
    record.title = "not carried";

    const auto payload = make_removed_payload(record);
    CHECK(payload.notification_uid == 42);
    CHECK(payload.timestamp_ms == 1000);
    CHECK(payload.category_id == 4);
    CHECK(std::string(payload.category_name) == "Social");
}

TEST_CASE("connection payload copies the device when known")
{
    ancs::DeviceHandle phone{"AA:BB:CC:DD:EE:FF", 1, "iPhone"};

    const auto up = make_connection_payload(ancs::ConnectionState::Connected, phone,
                                            ancs::Error::Ok);
    CHECK(up.state == ANCS_LINK_CONNECTED);
    CHECK(up.reason == 0);
    CHECK(up.address_type == 1);
    CHECK(std::string(up.address) == "AA:BB:CC:DD:EE:FF");
    CHECK(std::string(up.device_name) == "iPhone");

    const auto down = make_connection_payload(ancs::ConnectionState::Disconnected,
                                              std::nullopt, ancs::Error::ConnectionLost);
    CHECK(down.state == ANCS_LINK_DISCONNECTED);
    CHECK(down.reason == static_cast<uint8_t>(ancs::Error::ConnectionLost));
    CHECK(std::string(down.address).empty());
}

TEST_CASE("exhausted payload reports attempts")
{
    const auto named = make_exhausted_payload(std::string("iPhone"), 5);
    CHECK(named.attempts == 5);
    CHECK(std::string(named.device_name) == "iPhone");

    const auto anonymous = make_exhausted_payload(std::nullopt, 3);
    CHECK(anonymous.attempts == 3);
    CHECK(std::string(anonymous.device_name).empty());
}

TEST_CASE("attributes render as a compact JSON object keyed by name")
{
    ancs::AttributeMap attributes;
    attributes[ancs::AttributeId::Title] = "Hi";
    attributes[ancs::AttributeId::AppIdentifier] = "com.apple.MobileSMS";

    CHECK(attributes_to_json(attributes) ==
          R"({"appIdentifier":"com.apple.MobileSMS","title":"Hi"})");
    CHECK(attributes_to_json({}) == "{}");
}

TEST_CASE("record JSON omits absent attributes")
{
    auto record = make_record();
    record.title = "Alice";
    record.enrichment = ancs::EnrichmentStatus::Enriched;

    const std::string json = record_to_json(record);
    CHECK(json.find(R"("uid":42)") != std::string::npos);
    CHECK(json.find(R"("category":"Social")") != std::string::npos);
    CHECK(json.find(R"("important":true)") != std::string::npos);
    CHECK(json.find(R"("title":"Alice")") != std::string::npos);
    CHECK(json.find("message") == std::string::npos);
    CHECK(json.find("appIdentifier") == std::string::npos);
}
