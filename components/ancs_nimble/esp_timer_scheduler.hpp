/**
 * @file esp_timer_scheduler.hpp
 * @brief Scheduler backed by one-shot esp_timer timers
 *
 * Tasks run on the esp_timer task. The scheduler must outlive every timer
 * it armed; it is created once at boot and never destroyed in practice.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "scheduler.hpp"

extern "C" {
#include "esp_timer.h"
}

namespace ancs {

class EspTimerScheduler : public Scheduler {
public:
    EspTimerScheduler() = default;
    ~EspTimerScheduler() override;

    EspTimerScheduler(const EspTimerScheduler&) = delete;
    EspTimerScheduler& operator=(const EspTimerScheduler&) = delete;

    int64_t now_ms() const override;
    TimerId schedule_after(uint32_t delay_ms, Task task) override;
    void cancel(TimerId id) override;

    size_t pending() const;

private:
    struct Slot {
        EspTimerScheduler* owner;
        TimerId id;
        Task task;
        esp_timer_handle_t handle;
    };

    static void on_timer(void* arg);
    static void release(Slot* slot);

    mutable std::mutex mutex_;
    std::unordered_map<TimerId, Slot*> slots_;
    TimerId next_id_{1};
};

} // namespace ancs
