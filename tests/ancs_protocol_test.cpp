#include <array>
#include <cstdint>
#include <vector>

#include "ancs_protocol.hpp"
#include "notification_record.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace ancs;

namespace {
// Deterministic byte generator for the property checks
uint8_t next_byte(uint32_t& state)
{
    state = state * 1664525u + 1013904223u;
    return static_cast<uint8_t>(state >> 24);
}
}  // namespace

TEST_CASE("notification source scenario decodes an added email")
{
    const std::array<uint8_t, 8> bytes{0x00, 0x00, 0x06, 0x01, 0x2A, 0x00, 0x00, 0x00};
    NotificationSourceEvent event{};

    REQUIRE(decode_notification_source(bytes, event) == Error::Ok);
    CHECK(event.event_id == EventId::Added);
    CHECK(event.event_flags == 0);
    CHECK(event.category_id == static_cast<uint8_t>(CategoryId::Email));
    CHECK(event.category_count == 1);
    CHECK(event.notification_uid == 42u);
    CHECK(std::string(category_name(event.category_id)) == "Email");
}

TEST_CASE("notification source uid is bytes 4 to 7 little endian whatever the other fields")
{
    uint32_t state = 12345;
    for (size_t length = 8; length <= 20; ++length) {
        for (int round = 0; round < 50; ++round) {
            std::vector<uint8_t> bytes(length);
            for (auto& b : bytes) {
                b = next_byte(state);
            }
            const uint32_t expected = static_cast<uint32_t>(bytes[4]) |
                                      (static_cast<uint32_t>(bytes[5]) << 8) |
                                      (static_cast<uint32_t>(bytes[6]) << 16) |
                                      (static_cast<uint32_t>(bytes[7]) << 24);

            NotificationSourceEvent event{};
            REQUIRE(decode_notification_source(bytes, event) == Error::Ok);
            CHECK(event.notification_uid == expected);
        }
    }
}

TEST_CASE("notification source shorter than 8 bytes is malformed")
{
    const std::array<uint8_t, 7> storage{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
    for (size_t length = 0; length < 8; ++length) {
        NotificationSourceEvent event{};
        event.notification_uid = 0xCAFEBABE;

        CHECK(decode_notification_source(std::span<const uint8_t>(storage.data(), length), event) ==
              Error::MalformedPacket);
        CHECK(event.notification_uid == 0xCAFEBABE);
    }
}

TEST_CASE("get notification attributes command has the exact wire layout")
{
    const auto specs = default_attribute_specs(128, 128, 1024);
    const ByteBuffer command = encode_get_notification_attributes(0x12345678, specs);

    const ByteBuffer expected{
        0x00,                    // GetNotificationAttributes
        0x78, 0x56, 0x34, 0x12,  // UID
        0x00,                    // AppIdentifier, no length
        0x01, 0x80, 0x00,        // Title, 128
        0x02, 0x80, 0x00,        // Subtitle, 128
        0x03, 0x00, 0x04,        // Message, 1024
        0x05,                    // Date, no length
    };
    CHECK(command == expected);
    CHECK(specs.size() == 5);
}

TEST_CASE("encoded command header decodes back to command 0 and the uid")
{
    const auto specs = default_attribute_specs(64, 32, 512);
    for (uint32_t uid : {0u, 1u, 42u, 0x00FF00FFu, 0x80000000u, 0xFFFFFFFFu}) {
        const ByteBuffer command = encode_get_notification_attributes(uid, specs);

        CommandHeader header{};
        REQUIRE(decode_command_header(command, header) == Error::Ok);
        CHECK(header.command_id == 0);
        CHECK(header.notification_uid == uid);
    }
}

TEST_CASE("attribute chunk distinguishes incomplete from complete records")
{
    const std::vector<uint8_t> record{0x01, 0x05, 0x00, 'H', 'e', 'l', 'l', 'o', 0xAA};
    AttributeChunk chunk;

    SUBCASE("short header")
    {
        CHECK(decode_attribute_chunk(std::span<const uint8_t>(record.data(), 2), 0, chunk) ==
              Error::NeedMoreData);
    }

    SUBCASE("short value")
    {
        CHECK(decode_attribute_chunk(std::span<const uint8_t>(record.data(), 7), 0, chunk) ==
              Error::NeedMoreData);
    }

    SUBCASE("cursor past the end")
    {
        CHECK(decode_attribute_chunk(record, record.size() + 4, chunk) == Error::NeedMoreData);
    }

    SUBCASE("complete record")
    {
        REQUIRE(decode_attribute_chunk(record, 0, chunk) == Error::Ok);
        CHECK(chunk.id == AttributeId::Title);
        CHECK(chunk.value == "Hello");
        CHECK(chunk.next_cursor == 8);
    }

    SUBCASE("zero length record")
    {
        const std::vector<uint8_t> empty{0x02, 0x00, 0x00};
        REQUIRE(decode_attribute_chunk(empty, 0, chunk) == Error::Ok);
        CHECK(chunk.id == AttributeId::Subtitle);
        CHECK(chunk.value.empty());
        CHECK(chunk.next_cursor == 3);
    }
}

TEST_CASE("category names cover known ids and fall back for others")
{
    CHECK(std::string(category_name(0)) == "Other");
    CHECK(std::string(category_name(1)) == "Incoming Call");
    CHECK(std::string(category_name(8)) == "Health & Fitness");
    CHECK(std::string(category_name(11)) == "Entertainment");
    CHECK(std::string(category_name(12)) == "Notification");
    CHECK(std::string(category_name(255)) == "Notification");
}

TEST_CASE("importance comes from the important flag or an incoming call")
{
    CHECK(is_important_notification(event_flags::kImportant, 6));
    CHECK(is_important_notification(0, static_cast<uint8_t>(CategoryId::IncomingCall)));
    CHECK_FALSE(is_important_notification(event_flags::kSilent, 6));
    CHECK_FALSE(is_important_notification(event_flags::kPreExisting | event_flags::kPositiveAction, 2));
}

TEST_CASE("notification records derive category name and keep enrichment empty")
{
    NotificationSourceEvent event{EventId::Modified, event_flags::kSilent, 4, 3, 77};
    const NotificationRecord record = make_notification_record(9, event, 1234);

    CHECK(record.id == 9);
    CHECK(record.notification_uid == 77);
    CHECK(record.category_name == "Social");
    CHECK(record.is_silent());
    CHECK_FALSE(record.is_important);
    CHECK(record.enrichment == EnrichmentStatus::Pending);
    CHECK_FALSE(record.title.has_value());

    event.event_id = EventId::Removed;
    CHECK(make_notification_record(10, event, 0).enrichment == EnrichmentStatus::NotRequested);
}

TEST_CASE("applying attributes never invents missing ones")
{
    NotificationSourceEvent event{EventId::Added, 0, 6, 1, 5};
    NotificationRecord record = make_notification_record(1, event, 0);

    AttributeMap attributes;
    attributes[AttributeId::Title] = "Hi";
    attributes[AttributeId::Subtitle] = "";
    apply_attributes(record, attributes);

    CHECK(record.enrichment == EnrichmentStatus::Enriched);
    CHECK(record.title == std::optional<std::string>("Hi"));
    REQUIRE(record.subtitle.has_value());
    CHECK(record.subtitle->empty());
    CHECK_FALSE(record.message.has_value());
    CHECK_FALSE(record.app_identifier.has_value());
    CHECK(display_text(record) == "Hi");

    mark_unavailable(record);
    CHECK(display_text(record) == std::string(kContentUnavailable));
}

TEST_CASE("hex dump is upper case and space separated")
{
    const std::vector<uint8_t> bytes{0x00, 0x2A, 0xFF};
    CHECK(to_hex(bytes) == "00 2A FF");
    CHECK(to_hex(std::vector<uint8_t>{}).empty());
}

TEST_CASE("response bound follows the requested attribute lengths")
{
    // header, five record headers, two unbounded attributes, then the three caps
    CHECK(max_response_size(default_attribute_specs(128, 128, 1024)) == 5 + 15 + 256 * 2 + 128 + 128 + 1024);

    const std::vector<AttributeSpec> title_only{{AttributeId::Title, 64}};
    CHECK(max_response_size(title_only) == kCommandHeaderSize + kAttributeRecordHeaderSize + 64);
}
