#include "ancs_protocol.hpp"

namespace ancs {

namespace {

constexpr const char* kCategoryNames[] = {
    "Other",
    "Incoming Call",
    "Missed Call",
    "Voicemail",
    "Social",
    "Schedule",
    "Email",
    "News",
    "Health & Fitness",
    "Business & Finance",
    "Location",
    "Entertainment",
};

constexpr size_t kCategoryCount = sizeof(kCategoryNames) / sizeof(kCategoryNames[0]);

void append_u16_le(ByteBuffer& out, uint16_t value)
{
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void append_u32_le(ByteBuffer& out, uint32_t value)
{
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

} // anonymous namespace

const char* characteristic_name(CharacteristicId id)
{
    switch (id) {
        case CharacteristicId::NotificationSource: return "NotificationSource";
        case CharacteristicId::ControlPoint:       return "ControlPoint";
        case CharacteristicId::DataSource:         return "DataSource";
    }
    return "Unknown";
}

std::string_view characteristic_uuid(CharacteristicId id)
{
    switch (id) {
        case CharacteristicId::NotificationSource: return uuid::kNotificationSource;
        case CharacteristicId::ControlPoint:       return uuid::kControlPoint;
        case CharacteristicId::DataSource:         return uuid::kDataSource;
    }
    return {};
}

const char* event_id_name(EventId id)
{
    switch (id) {
        case EventId::Added:    return "Added";
        case EventId::Modified: return "Modified";
        case EventId::Removed:  return "Removed";
    }
    return "Reserved";
}

const char* attribute_name(AttributeId id)
{
    switch (id) {
        case AttributeId::AppIdentifier:       return "appIdentifier";
        case AttributeId::Title:               return "title";
        case AttributeId::Subtitle:            return "subtitle";
        case AttributeId::Message:             return "message";
        case AttributeId::MessageSize:         return "messageSize";
        case AttributeId::Date:                return "date";
        case AttributeId::PositiveActionLabel: return "positiveActionLabel";
        case AttributeId::NegativeActionLabel: return "negativeActionLabel";
    }
    return "unknown";
}

const char* category_name(uint8_t category_id)
{
    if (category_id < kCategoryCount) {
        return kCategoryNames[category_id];
    }
    return "Notification";
}

bool is_known_attribute(AttributeId id)
{
    return static_cast<uint8_t>(id) <= static_cast<uint8_t>(AttributeId::NegativeActionLabel);
}

bool has_max_length(AttributeId id)
{
    return id == AttributeId::Title || id == AttributeId::Subtitle || id == AttributeId::Message;
}

std::vector<AttributeSpec> default_attribute_specs(uint16_t title_max,
                                                   uint16_t subtitle_max,
                                                   uint16_t message_max)
{
    return {
        {AttributeId::AppIdentifier, 0},
        {AttributeId::Title, title_max},
        {AttributeId::Subtitle, subtitle_max},
        {AttributeId::Message, message_max},
        {AttributeId::Date, 0},
    };
}

ByteBuffer encode_get_notification_attributes(uint32_t notification_uid,
                                              std::span<const AttributeSpec> specs)
{
    ByteBuffer out;
    out.reserve(kCommandHeaderSize + specs.size() * 3);

    out.push_back(static_cast<uint8_t>(CommandId::GetNotificationAttributes));
    append_u32_le(out, notification_uid);

    for (const auto& spec : specs) {
        out.push_back(static_cast<uint8_t>(spec.id));
        if (has_max_length(spec.id)) {
            append_u16_le(out, spec.max_length);
        }
    }

    return out;
}

size_t max_response_size(std::span<const AttributeSpec> specs)
{
    size_t total = kCommandHeaderSize;
    for (const auto& spec : specs) {
        total += kAttributeRecordHeaderSize;
        total += has_max_length(spec.id) ? spec.max_length : kUnboundedAttributeMaxLength;
    }
    return total;
}

uint32_t read_u32_le(const uint8_t* data)
{
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

uint16_t read_u16_le(const uint8_t* data)
{
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

Error decode_notification_source(std::span<const uint8_t> bytes, NotificationSourceEvent& out)
{
    if (bytes.size() < kNotificationSourceSize) {
        return Error::MalformedPacket;
    }

    out.event_id = static_cast<EventId>(bytes[0]);
    out.event_flags = bytes[1];
    out.category_id = bytes[2];
    out.category_count = bytes[3];
    out.notification_uid = read_u32_le(&bytes[4]);
    return Error::Ok;
}

Error decode_command_header(std::span<const uint8_t> bytes, CommandHeader& out)
{
    if (bytes.size() < kCommandHeaderSize) {
        return Error::NeedMoreData;
    }

    out.command_id = bytes[0];
    out.notification_uid = read_u32_le(&bytes[1]);
    return Error::Ok;
}

Error decode_attribute_chunk(std::span<const uint8_t> buffer, size_t cursor, AttributeChunk& out)
{
    if (cursor > buffer.size() || buffer.size() - cursor < kAttributeRecordHeaderSize) {
        return Error::NeedMoreData;
    }

    const uint16_t length = read_u16_le(&buffer[cursor + 1]);
    const size_t value_start = cursor + kAttributeRecordHeaderSize;
    if (buffer.size() - value_start < length) {
        return Error::NeedMoreData;
    }

    out.id = static_cast<AttributeId>(buffer[cursor]);
    out.value.assign(reinterpret_cast<const char*>(buffer.data() + value_start), length);
    out.next_cursor = value_start + length;
    return Error::Ok;
}

std::string to_hex(std::span<const uint8_t> bytes)
{
    static constexpr char kDigits[] = "0123456789ABCDEF";

    std::string out;
    if (bytes.empty()) {
        return out;
    }

    out.reserve(bytes.size() * 3 - 1);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out.push_back(' ');
        }
        out.push_back(kDigits[bytes[i] >> 4]);
        out.push_back(kDigits[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace ancs
