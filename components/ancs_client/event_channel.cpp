#include "event_channel.hpp"

#include <algorithm>
#include <utility>

namespace ancs {

EventChannel::SubscriptionId EventChannel::subscribe(Handler handler, uint32_t mask)
{
    if (!handler) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = next_id_++;
    subscribers_.push_back({id, mask, std::move(handler)});
    return id;
}

bool EventChannel::unsubscribe(SubscriptionId id)
{
    if (id == 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
        [id](const Subscriber& sub) { return sub.id == id; });
    if (it == subscribers_.end()) {
        return false;
    }
    subscribers_.erase(it);
    return true;
}

void EventChannel::publish(const EngineEvent& event)
{
    const uint32_t bit = event_mask::bit(event.kind);

    // Copy under the lock, dispatch without it
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subscribers_) {
            if ((sub.mask & bit) != 0) {
                targets.push_back(sub);
            }
        }
    }

    published_total_.fetch_add(1, std::memory_order_relaxed);

    for (const auto& sub : targets) {
        sub.handler(event);
    }
}

size_t EventChannel::subscriber_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

} // namespace ancs
