// tests/support/manual_scheduler.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

#include "scheduler.hpp"

namespace ancs_test {

/**
 * Scheduler driven by the test: time only moves through advance().
 * Due tasks run on the calling thread, outside the scheduler lock.
 */
class ManualScheduler : public ancs::Scheduler {
public:
    int64_t now_ms() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    TimerId schedule_after(uint32_t delay_ms, Task task) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const TimerId id = next_id_++;
        timers_.push_back({id, now_ + delay_ms, std::move(task)});
        scheduled_delays_.push_back(delay_ms);
        return id;
    }

    void cancel(TimerId id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                                     [id](const Timer& t) { return t.id == id; }),
                      timers_.end());
    }

    void advance(uint32_t ms)
    {
        int64_t target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            target = now_ + ms;
        }

        for (;;) {
            Task task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = std::min_element(timers_.begin(), timers_.end(),
                    [](const Timer& a, const Timer& b) {
                        return a.deadline != b.deadline ? a.deadline < b.deadline : a.id < b.id;
                    });
                if (it == timers_.end() || it->deadline > target) {
                    now_ = target;
                    return;
                }
                now_ = it->deadline;
                task = std::move(it->task);
                timers_.erase(it);
            }
            task();
        }
    }

    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_.size();
    }

    std::vector<uint32_t> scheduled_delays() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return scheduled_delays_;
    }

private:
    struct Timer {
        TimerId id;
        int64_t deadline;
        Task task;
    };

    mutable std::mutex mutex_;
    int64_t now_{0};
    TimerId next_id_{1};
    std::vector<Timer> timers_;
    std::vector<uint32_t> scheduled_delays_;
};

} // namespace ancs_test
