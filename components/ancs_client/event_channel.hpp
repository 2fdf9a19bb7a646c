/**
 * @file event_channel.hpp
 * @brief Broadcast channel for engine events
 *
 * Any number of subscribers, each filtered by a kind mask. Events are
 * delivered synchronously, in publish order, on the publishing task.
 * Handlers may subscribe or unsubscribe from inside a callback.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "engine_events.hpp"

namespace ancs {

class EventChannel {
public:
    using Handler = std::function<void(const EngineEvent&)>;
    using SubscriptionId = uint64_t;

    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /**
     * @return 0 when @p handler is empty
     */
    SubscriptionId subscribe(Handler handler, uint32_t mask = event_mask::kAll);
    bool unsubscribe(SubscriptionId id);

    void publish(const EngineEvent& event);

    size_t subscriber_count() const;
    uint64_t published_total() const { return published_total_.load(std::memory_order_relaxed); }

private:
    struct Subscriber {
        SubscriptionId id;
        uint32_t mask;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscriber> subscribers_;
    SubscriptionId next_id_{1};
    std::atomic<uint64_t> published_total_{0};
};

} // namespace ancs
