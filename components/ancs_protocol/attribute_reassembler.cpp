#include "attribute_reassembler.hpp"

#include <cstdio>
#include <utility>

namespace ancs {

const char* reassembly_status_name(ReassemblyResult::Status status)
{
    switch (status) {
        case ReassemblyResult::Status::Incomplete:    return "Incomplete";
        case ReassemblyResult::Status::Complete:      return "Complete";
        case ReassemblyResult::Status::ProtocolError: return "ProtocolError";
    }
    return "Unknown";
}

void AttributeReassembler::begin(uint32_t expected_uid, size_t expected_count,
                                 size_t max_response_size)
{
    reset();
    expected_uid_ = expected_uid;
    expected_count_ = expected_count;
    max_response_size_ = max_response_size;
    active_ = true;
}

void AttributeReassembler::reset()
{
    buffer_.clear();
    attributes_.clear();
    expected_uid_ = 0;
    expected_count_ = 0;
    decoded_count_ = 0;
    cursor_ = 0;
    header_checked_ = false;
    active_ = false;
}

ReassemblyResult AttributeReassembler::fail(std::string message)
{
    active_ = false;

    ReassemblyResult result;
    result.status = ReassemblyResult::Status::ProtocolError;
    result.error_message = std::move(message);
    return result;
}

ReassemblyResult AttributeReassembler::feed(std::span<const uint8_t> bytes)
{
    if (!active_) {
        return fail("no attribute request in flight");
    }

    if (buffer_.size() + bytes.size() > max_response_size_) {
        return fail("response exceeds " + std::to_string(max_response_size_) + " bytes");
    }

    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());

    if (!header_checked_) {
        CommandHeader header{};
        if (decode_command_header(buffer_, header) == Error::NeedMoreData) {
            return {};
        }

        if (header.command_id != static_cast<uint8_t>(CommandId::GetNotificationAttributes)) {
            char message[48];
            std::snprintf(message, sizeof(message), "unexpected command id %u",
                          static_cast<unsigned>(header.command_id));
            return fail(message);
        }

        if (header.notification_uid != expected_uid_) {
            char message[64];
            std::snprintf(message, sizeof(message), "uid mismatch: got %lu, expected %lu",
                          static_cast<unsigned long>(header.notification_uid),
                          static_cast<unsigned long>(expected_uid_));
            return fail(message);
        }

        header_checked_ = true;
        cursor_ = kCommandHeaderSize;
    }

    while (decoded_count_ < expected_count_) {
        AttributeChunk chunk;
        if (decode_attribute_chunk(buffer_, cursor_, chunk) == Error::NeedMoreData) {
            return {};
        }

        // Unknown ids are consumed and counted but not stored.
        if (is_known_attribute(chunk.id)) {
            attributes_[chunk.id] = std::move(chunk.value);
        }
        cursor_ = chunk.next_cursor;
        ++decoded_count_;
    }

    active_ = false;

    ReassemblyResult result;
    result.status = ReassemblyResult::Status::Complete;
    result.attributes = std::move(attributes_);
    attributes_.clear();
    return result;
}

} // namespace ancs
