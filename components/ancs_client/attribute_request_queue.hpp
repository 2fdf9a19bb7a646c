/**
 * @file attribute_request_queue.hpp
 * @brief Single-flight scheduler for Get Notification Attributes commands
 *
 * At most one command is outstanding on the Control Point. Further
 * requests wait in a FIFO backlog. Each request gets
 * 1 + EngineConfig::attribute_retries attempts; an attempt fails on
 * timeout, on a rejected write or on a malformed response. When every
 * attempt has failed the record is delivered unenriched and the queue
 * moves on.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ancs_error.hpp"
#include "ancs_protocol.hpp"
#include "attribute_reassembler.hpp"
#include "engine_config.hpp"
#include "engine_events.hpp"
#include "gatt_transport.hpp"
#include "notification_record.hpp"
#include "scheduler.hpp"
#include "serial_context.hpp"

namespace ancs {

/**
 * @brief Sink for Control Point commands (the connection manager)
 */
class ControlPointWriter {
public:
    virtual ~ControlPointWriter() = default;

    virtual Error write_control_point(std::span<const uint8_t> command,
                                      GattTransport::Completion on_written) = 0;
};

class AttributeRequestQueue {
public:
    // outcome: Ok (enriched), MaxRetriesExceeded, QueueFull or ConnectionLost
    using ResolveHandler = std::function<void(NotificationRecord&& record, Error outcome)>;
    using DebugHandler = std::function<void(DebugKind kind, std::string text,
                                            const AttributeMap* attributes)>;

    AttributeRequestQueue(SerialContext& context,
                          ControlPointWriter& writer,
                          Scheduler& scheduler,
                          const EngineConfig& config);
    ~AttributeRequestQueue();

    AttributeRequestQueue(const AttributeRequestQueue&) = delete;
    AttributeRequestQueue& operator=(const AttributeRequestQueue&) = delete;

    void set_resolve_handler(ResolveHandler handler);
    void set_debug_handler(DebugHandler handler);

    /**
     * @brief Queue @p record for enrichment
     *
     * @return Error::QueueFull when the backlog is at capacity; the record
     *         has then already been resolved unenriched.
     */
    Error enqueue(NotificationRecord record);

    /**
     * @brief Data Source bytes; ignored when nothing is in flight
     */
    void on_data_source(std::span<const uint8_t> bytes);

    /**
     * @brief Resolve or discard every request and stop all timers
     */
    void drain(DrainPolicy policy);

    bool has_in_flight() const;
    std::optional<uint32_t> in_flight_uid() const;
    uint8_t in_flight_retry_count() const;
    size_t backlog_size() const;

    struct Stats {
        uint32_t enqueued;
        uint32_t commands_written;
        uint32_t retries;
        uint32_t timeouts;
        uint32_t protocol_errors;
        uint32_t write_failures;
        uint32_t enriched;
        uint32_t degraded;
        uint32_t drained;
        uint32_t stray_data_packets;
    };

    Stats get_stats() const;

private:
    struct AttributeRequest {
        NotificationRecord record;
        uint8_t retry_count{0};
        bool awaiting_response{false};
    };

    void pump();
    bool transmit();
    bool retry_or_degrade(Error reason);
    void fail_attempt(Error reason);
    void resolve_in_flight(Error outcome, const AttributeMap* attributes);
    void resolve(NotificationRecord&& record, Error outcome);

    void arm_timeout(uint64_t attempt);
    void cancel_timeout();
    void handle_timeout(uint64_t attempt);
    void handle_write_result(uint64_t attempt, Error result);

    void debug(DebugKind kind, std::string text, const AttributeMap* attributes = nullptr);

    SerialContext& context_;
    ControlPointWriter& writer_;
    Scheduler& scheduler_;
    const EngineConfig& config_;
    const std::vector<AttributeSpec> specs_;
    const size_t response_limit_;

    std::optional<AttributeRequest> in_flight_;
    std::deque<AttributeRequest> backlog_;
    AttributeReassembler reassembler_;

    // Identifies the current attempt; late completions and timer firings
    // carrying an older value are ignored.
    uint64_t attempt_seq_{0};
    Scheduler::TimerId timeout_timer_{Scheduler::kInvalidTimer};

    ResolveHandler resolve_handler_;
    DebugHandler debug_handler_;
    Stats stats_{};
};

} // namespace ancs
