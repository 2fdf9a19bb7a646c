#include "attribute_request_queue.hpp"

#include <cstdio>
#include <utility>

namespace ancs {

namespace {

std::string describe(const char* what, uint32_t uid, uint8_t attempt)
{
    char text[96];
    std::snprintf(text, sizeof(text), "%s (uid=%lu, attempt %u)", what,
                  static_cast<unsigned long>(uid), static_cast<unsigned>(attempt) + 1);
    return text;
}

} // anonymous namespace

AttributeRequestQueue::AttributeRequestQueue(SerialContext& context,
                                             ControlPointWriter& writer,
                                             Scheduler& scheduler,
                                             const EngineConfig& config)
    : context_(context),
      writer_(writer),
      scheduler_(scheduler),
      config_(config),
      specs_(default_attribute_specs(config.title_max_length,
                                     config.subtitle_max_length,
                                     config.message_max_length)),
      response_limit_(max_response_size(specs_))
{
}

AttributeRequestQueue::~AttributeRequestQueue()
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    cancel_timeout();
    ++attempt_seq_;
}

void AttributeRequestQueue::set_resolve_handler(ResolveHandler handler)
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    resolve_handler_ = std::move(handler);
}

void AttributeRequestQueue::set_debug_handler(DebugHandler handler)
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    debug_handler_ = std::move(handler);
}

// =============================================================================
// Caller entry points
// =============================================================================

Error AttributeRequestQueue::enqueue(NotificationRecord record)
{
    Error result = Error::Ok;

    context_.run([&] {
        ++stats_.enqueued;

        if (backlog_.size() >= config_.backlog_capacity) {
            debug(DebugKind::Error, describe("backlog full, delivering unenriched",
                                             record.notification_uid, 0));
            ++stats_.degraded;
            resolve(std::move(record), Error::QueueFull);
            result = Error::QueueFull;
            return;
        }

        AttributeRequest request;
        request.record = std::move(record);
        backlog_.push_back(std::move(request));
        pump();
    });

    return result;
}

void AttributeRequestQueue::on_data_source(std::span<const uint8_t> bytes)
{
    context_.run([&] {
        if (!in_flight_ || !in_flight_->awaiting_response) {
            ++stats_.stray_data_packets;
            debug(DebugKind::Error, "Data Source packet with no request in flight, ignored");
            return;
        }

        // A packet that cannot open a response is the tail of one whose
        // attempt already ended; the current attempt keeps waiting.
        if (reassembler_.awaiting_header() &&
            (bytes.empty() ||
             bytes[0] != static_cast<uint8_t>(CommandId::GetNotificationAttributes))) {
            ++stats_.stray_data_packets;
            debug(DebugKind::Error, describe("Data Source packet before response header, ignored",
                                             in_flight_->record.notification_uid,
                                             in_flight_->retry_count));
            return;
        }

        ReassemblyResult result = reassembler_.feed(bytes);
        switch (result.status) {
            case ReassemblyResult::Status::Incomplete:
                break;

            case ReassemblyResult::Status::Complete:
                debug(DebugKind::ParsedAttributes,
                      describe("attributes received", in_flight_->record.notification_uid,
                               in_flight_->retry_count),
                      &result.attributes);
                resolve_in_flight(Error::Ok, &result.attributes);
                pump();
                break;

            case ReassemblyResult::Status::ProtocolError:
                ++stats_.protocol_errors;
                debug(DebugKind::Error, "Data Source response rejected: " + result.error_message);
                fail_attempt(Error::ProtocolError);
                break;
        }
    });
}

void AttributeRequestQueue::drain(DrainPolicy policy)
{
    context_.run([&] {
        cancel_timeout();
        reassembler_.reset();
        ++attempt_seq_;

        std::vector<NotificationRecord> pending;
        if (in_flight_) {
            pending.push_back(std::move(in_flight_->record));
            in_flight_.reset();
        }
        for (auto& request : backlog_) {
            pending.push_back(std::move(request.record));
        }
        backlog_.clear();

        stats_.drained += static_cast<uint32_t>(pending.size());

        if (policy == DrainPolicy::Discard) {
            return;
        }
        for (auto& record : pending) {
            resolve(std::move(record), Error::ConnectionLost);
        }
    });
}

// =============================================================================
// Observers
// =============================================================================

bool AttributeRequestQueue::has_in_flight() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return in_flight_.has_value();
}

std::optional<uint32_t> AttributeRequestQueue::in_flight_uid() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    if (!in_flight_) {
        return std::nullopt;
    }
    return in_flight_->record.notification_uid;
}

uint8_t AttributeRequestQueue::in_flight_retry_count() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return in_flight_ ? in_flight_->retry_count : 0;
}

size_t AttributeRequestQueue::backlog_size() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return backlog_.size();
}

AttributeRequestQueue::Stats AttributeRequestQueue::get_stats() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return stats_;
}

// =============================================================================
// Slot state machine (context held)
// =============================================================================

void AttributeRequestQueue::pump()
{
    for (;;) {
        if (!in_flight_) {
            if (backlog_.empty()) {
                return;
            }
            in_flight_.emplace(std::move(backlog_.front()));
            backlog_.pop_front();
        }

        if (in_flight_->awaiting_response || transmit()) {
            return;
        }

        // Rejected synchronously by the transport
        ++stats_.write_failures;
        debug(DebugKind::Error, describe("Control Point write rejected",
                                         in_flight_->record.notification_uid,
                                         in_flight_->retry_count));
        retry_or_degrade(Error::TransportWriteFailure);
    }
}

bool AttributeRequestQueue::transmit()
{
    AttributeRequest& request = *in_flight_;
    const uint32_t uid = request.record.notification_uid;
    const uint64_t attempt = ++attempt_seq_;

    reassembler_.begin(uid, specs_.size(), response_limit_);
    const ByteBuffer command = encode_get_notification_attributes(uid, specs_);

    request.awaiting_response = true;
    arm_timeout(attempt);

    const Error err = writer_.write_control_point(command, [this, attempt](Error result) {
        context_.run([&] { handle_write_result(attempt, result); });
    });

    if (err != Error::Ok) {
        cancel_timeout();
        reassembler_.reset();
        request.awaiting_response = false;
        return false;
    }

    ++stats_.commands_written;
    debug(DebugKind::ControlPointCommand, to_hex(command));
    return true;
}

bool AttributeRequestQueue::retry_or_degrade(Error reason)
{
    AttributeRequest& request = *in_flight_;

    if (request.retry_count < config_.attribute_retries) {
        ++request.retry_count;
        ++stats_.retries;
        request.awaiting_response = false;
        return true;
    }

    debug(DebugKind::Error,
          describe(reason == Error::RequestTimeout ? "giving up after timeout"
                                                   : "giving up after failure",
                   request.record.notification_uid, request.retry_count));
    ++stats_.degraded;
    resolve_in_flight(Error::MaxRetriesExceeded, nullptr);
    return false;
}

void AttributeRequestQueue::fail_attempt(Error reason)
{
    cancel_timeout();
    reassembler_.reset();
    ++attempt_seq_;

    retry_or_degrade(reason);
    pump();
}

void AttributeRequestQueue::resolve_in_flight(Error outcome, const AttributeMap* attributes)
{
    cancel_timeout();
    reassembler_.reset();

    NotificationRecord record = std::move(in_flight_->record);
    in_flight_.reset();

    if (outcome == Error::Ok && attributes != nullptr) {
        apply_attributes(record, *attributes);
        ++stats_.enriched;
    }
    resolve(std::move(record), outcome);
}

void AttributeRequestQueue::resolve(NotificationRecord&& record, Error outcome)
{
    if (outcome != Error::Ok) {
        mark_unavailable(record);
    }
    if (resolve_handler_) {
        resolve_handler_(std::move(record), outcome);
    }
}

// =============================================================================
// Timer and write completions
// =============================================================================

void AttributeRequestQueue::arm_timeout(uint64_t attempt)
{
    cancel_timeout();
    timeout_timer_ = scheduler_.schedule_after(config_.attribute_timeout_ms, [this, attempt]() {
        context_.run([&] { handle_timeout(attempt); });
    });
}

void AttributeRequestQueue::cancel_timeout()
{
    if (timeout_timer_ != Scheduler::kInvalidTimer) {
        scheduler_.cancel(timeout_timer_);
        timeout_timer_ = Scheduler::kInvalidTimer;
    }
}

void AttributeRequestQueue::handle_timeout(uint64_t attempt)
{
    if (attempt != attempt_seq_ || !in_flight_) {
        return;
    }

    timeout_timer_ = Scheduler::kInvalidTimer;
    ++stats_.timeouts;
    debug(DebugKind::Error, describe("attribute response timed out",
                                     in_flight_->record.notification_uid,
                                     in_flight_->retry_count));
    fail_attempt(Error::RequestTimeout);
}

void AttributeRequestQueue::handle_write_result(uint64_t attempt, Error result)
{
    if (attempt != attempt_seq_ || !in_flight_ || result == Error::Ok) {
        return;
    }

    ++stats_.write_failures;
    debug(DebugKind::Error, describe("Control Point write failed",
                                     in_flight_->record.notification_uid,
                                     in_flight_->retry_count));
    fail_attempt(Error::TransportWriteFailure);
}

void AttributeRequestQueue::debug(DebugKind kind, std::string text, const AttributeMap* attributes)
{
    if (debug_handler_) {
        debug_handler_(kind, std::move(text), attributes);
    }
}

} // namespace ancs
