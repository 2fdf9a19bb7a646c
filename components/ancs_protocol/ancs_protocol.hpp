/**
 * @file ancs_protocol.hpp
 * @brief ANCS wire format: constants, command encoder and payload decoders
 *
 * Notification Source (8 bytes, notify):
 * +---------+------------+------------+---------------+----------------------+
 * | EventID | EventFlags | CategoryID | CategoryCount | NotificationUID (LE) |
 * |   1B    |     1B     |     1B     |      1B       |          4B          |
 * +---------+------------+------------+---------------+----------------------+
 *
 * Control Point, Get Notification Attributes (write with response):
 * +-----------+----------------------+--------+---------------+-----+
 * | CommandID | NotificationUID (LE) | AttrID | MaxLen (LE)*  | ... |
 * |   0x00    |          4B          |   1B   |      2B       |     |
 * +-----------+----------------------+--------+---------------+-----+
 *  * only for Title, Subtitle and Message
 *
 * Data Source response (notify, may span several packets):
 * +-----------+----------------------+--------+------------+---------+-----+
 * | CommandID | NotificationUID (LE) | AttrID | Len (LE)   | Value   | ... |
 * |   0x00    |          4B          |   1B   |     2B     | Len B   |     |
 * +-----------+----------------------+--------+------------+---------+-----+
 *
 * The response carries no end marker: it is complete once as many attribute
 * records as were requested have been received.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ancs_error.hpp"

namespace ancs {

using ByteBuffer = std::vector<uint8_t>;

// =============================================================================
// GATT identifiers
// =============================================================================

namespace uuid {
constexpr std::string_view kService = "7905F431-B5CE-4E99-A40F-4B1E122D00D0";
constexpr std::string_view kNotificationSource = "9FBF120D-6301-42D9-8C58-25E699A21DBD";
constexpr std::string_view kControlPoint = "69D1D8F3-45E1-49A8-9821-9BBDFDAAD9D9";
constexpr std::string_view kDataSource = "22EAC6E9-24D6-4BB5-BE44-B36ACE7C7BFB";
constexpr uint16_t kClientCharacteristicConfig = 0x2902;
} // namespace uuid

enum class CharacteristicId : uint8_t {
    NotificationSource = 0,
    ControlPoint,
    DataSource,
};

const char* characteristic_name(CharacteristicId id);
std::string_view characteristic_uuid(CharacteristicId id);

// =============================================================================
// Protocol enumerations
// =============================================================================

enum class CommandId : uint8_t {
    GetNotificationAttributes = 0,
    GetAppAttributes = 1,
    PerformNotificationAction = 2,
};

enum class AttributeId : uint8_t {
    AppIdentifier = 0,
    Title = 1,
    Subtitle = 2,
    Message = 3,
    MessageSize = 4,
    Date = 5,
    PositiveActionLabel = 6,
    NegativeActionLabel = 7,
};

// Values above 2 are reserved; the decoder keeps them as-is.
enum class EventId : uint8_t {
    Added = 0,
    Modified = 1,
    Removed = 2,
};

namespace event_flags {
constexpr uint8_t kSilent = 0x01;
constexpr uint8_t kImportant = 0x02;
constexpr uint8_t kPreExisting = 0x04;
constexpr uint8_t kPositiveAction = 0x08;
constexpr uint8_t kNegativeAction = 0x10;
} // namespace event_flags

enum class CategoryId : uint8_t {
    Other = 0,
    IncomingCall = 1,
    MissedCall = 2,
    Voicemail = 3,
    Social = 4,
    Schedule = 5,
    Email = 6,
    News = 7,
    HealthAndFitness = 8,
    BusinessAndFinance = 9,
    Location = 10,
    Entertainment = 11,
};

const char* event_id_name(EventId id);
const char* attribute_name(AttributeId id);

/**
 * @brief Human readable category, "Notification" for unknown ids
 */
const char* category_name(uint8_t category_id);

bool is_known_attribute(AttributeId id);

/**
 * @brief True for attributes whose request carries a 2-byte max length
 */
bool has_max_length(AttributeId id);

// =============================================================================
// Control Point encoding
// =============================================================================

struct AttributeSpec {
    AttributeId id;
    uint16_t max_length; // ignored unless has_max_length(id)
};

constexpr size_t kCommandHeaderSize = 5;          // CommandID + UID
constexpr size_t kNotificationSourceSize = 8;
constexpr size_t kAttributeRecordHeaderSize = 3;  // AttrID + Len

// Bound assumed for attributes requested without a max length
// (AppIdentifier, Date)
constexpr uint16_t kUnboundedAttributeMaxLength = 256;

/**
 * @brief Attribute set requested for every notification
 *
 * AppIdentifier, Title, Subtitle, Message and Date, in that order.
 */
std::vector<AttributeSpec> default_attribute_specs(uint16_t title_max,
                                                   uint16_t subtitle_max,
                                                   uint16_t message_max);

ByteBuffer encode_get_notification_attributes(uint32_t notification_uid,
                                              std::span<const AttributeSpec> specs);

/**
 * @brief Largest well-formed Data Source response to a request for @p specs
 */
size_t max_response_size(std::span<const AttributeSpec> specs);

// =============================================================================
// Decoding
// =============================================================================

struct NotificationSourceEvent {
    EventId event_id;
    uint8_t event_flags;
    uint8_t category_id;
    uint8_t category_count;
    uint32_t notification_uid;
};

/**
 * @brief Decode an 8-byte Notification Source packet
 *
 * @return Error::MalformedPacket when fewer than 8 bytes are supplied.
 *         Bytes beyond the eighth are ignored.
 */
Error decode_notification_source(std::span<const uint8_t> bytes, NotificationSourceEvent& out);

struct CommandHeader {
    uint8_t command_id;
    uint32_t notification_uid;
};

/**
 * @brief Read CommandID + UID from a command or a Data Source response
 *
 * @return Error::NeedMoreData when fewer than 5 bytes are available.
 */
Error decode_command_header(std::span<const uint8_t> bytes, CommandHeader& out);

struct AttributeChunk {
    AttributeId id;
    std::string value;
    size_t next_cursor;
};

/**
 * @brief Decode one attribute record starting at @p cursor
 *
 * @return Error::Ok with @p out filled, or Error::NeedMoreData when the
 *         buffer ends inside the id, the length field or the value.
 *         @p out is untouched in the second case.
 */
Error decode_attribute_chunk(std::span<const uint8_t> buffer, size_t cursor, AttributeChunk& out);

uint32_t read_u32_le(const uint8_t* data);
uint16_t read_u16_le(const uint8_t* data);

/**
 * @brief Space separated upper-case hex dump ("00 2A 00")
 */
std::string to_hex(std::span<const uint8_t> bytes);

} // namespace ancs
