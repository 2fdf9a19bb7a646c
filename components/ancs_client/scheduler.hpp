/**
 * @file scheduler.hpp
 * @brief One-shot timers used for request timeouts and reconnect backoff
 */

#pragma once

#include <cstdint>
#include <functional>

namespace ancs {

class Scheduler {
public:
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    static constexpr TimerId kInvalidTimer = 0;

    virtual ~Scheduler() = default;

    virtual int64_t now_ms() const = 0;

    /**
     * @return kInvalidTimer when the timer could not be created
     */
    virtual TimerId schedule_after(uint32_t delay_ms, Task task) = 0;

    /**
     * @brief Cancel a pending timer; unknown or fired ids are ignored
     */
    virtual void cancel(TimerId id) = 0;
};

} // namespace ancs
