/**
 * @file attribute_reassembler.hpp
 * @brief Accumulates Data Source packets into a parsed attribute set
 *
 * One reassembler serves the single in-flight attribute request. Records are
 * parsed incrementally: bytes that end inside a record stay buffered until
 * the next packet arrives.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

#include "ancs_protocol.hpp"

namespace ancs {

// Key present with an empty value means "sent with zero length".
using AttributeMap = std::map<AttributeId, std::string>;

struct ReassemblyResult {
    enum class Status : uint8_t {
        Incomplete,
        Complete,
        ProtocolError,
    };

    Status status{Status::Incomplete};
    AttributeMap attributes;    // Complete only
    std::string error_message;  // ProtocolError only
};

const char* reassembly_status_name(ReassemblyResult::Status status);

class AttributeReassembler {
public:
    // Response bound used when begin() is not given one.
    static constexpr size_t kDefaultMaxResponseSize = 4096;

    AttributeReassembler() = default;

    /**
     * @brief Start collecting the response for @p expected_uid
     *
     * Clears any previous buffer. @p expected_count is the number of
     * attributes the originating command asked for; a response growing
     * past @p max_response_size is a protocol error.
     */
    void begin(uint32_t expected_uid, size_t expected_count,
               size_t max_response_size = kDefaultMaxResponseSize);

    void reset();

    ReassemblyResult feed(std::span<const uint8_t> bytes);

    bool is_active() const { return active_; }
    uint32_t expected_uid() const { return expected_uid_; }
    size_t buffered_bytes() const { return buffer_.size(); }
    size_t decoded_count() const { return decoded_count_; }

    // True until the first byte of the response has been buffered.
    bool awaiting_header() const { return active_ && buffer_.empty(); }

private:
    ReassemblyResult fail(std::string message);

    std::vector<uint8_t> buffer_;
    AttributeMap attributes_;
    uint32_t expected_uid_{0};
    size_t expected_count_{0};
    size_t max_response_size_{kDefaultMaxResponseSize};
    size_t decoded_count_{0};
    size_t cursor_{0};
    bool header_checked_{false};
    bool active_{false};
};

} // namespace ancs
