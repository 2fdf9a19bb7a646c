/**
 * @file esp_timer_scheduler.cpp
 * @brief One-shot esp_timer timers for request timeouts and reconnect backoff
 */

#include "esp_timer_scheduler.hpp"

#include <new>
#include <utility>

extern "C" {
#include "esp_log.h"
}

static const char* TAG = "ancs_timer";

namespace ancs {

EspTimerScheduler::~EspTimerScheduler()
{
    std::unordered_map<TimerId, Slot*> slots;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slots.swap(slots_);
    }

    for (auto& entry : slots) {
        Slot* slot = entry.second;
        if (esp_timer_stop(slot->handle) == ESP_OK) {
            release(slot);
        }
    }
}

int64_t EspTimerScheduler::now_ms() const
{
    return esp_timer_get_time() / 1000;
}

Scheduler::TimerId EspTimerScheduler::schedule_after(uint32_t delay_ms, Task task)
{
    auto* slot = new (std::nothrow) Slot{this, kInvalidTimer, std::move(task), nullptr};
    if (slot == nullptr) {
        ESP_LOGE(TAG, "Out of memory for timer");
        return kInvalidTimer;
    }

    const esp_timer_create_args_t args = {
        .callback = &EspTimerScheduler::on_timer,
        .arg = slot,
        .dispatch_method = ESP_TIMER_TASK,
        .name = "ancs",
        .skip_unhandled_events = false,
    };

    esp_err_t err = esp_timer_create(&args, &slot->handle);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "esp_timer_create failed: %s", esp_err_to_name(err));
        delete slot;
        return kInvalidTimer;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot->id = next_id_++;
        slots_[slot->id] = slot;
    }

    err = esp_timer_start_once(slot->handle, static_cast<uint64_t>(delay_ms) * 1000ULL);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "esp_timer_start_once failed: %s", esp_err_to_name(err));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slots_.erase(slot->id);
        }
        release(slot);
        return kInvalidTimer;
    }

    return slot->id;
}

void EspTimerScheduler::cancel(TimerId id)
{
    Slot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) {
            return;
        }
        slot = it->second;
        slots_.erase(it);
    }

    // Stop fails once the callback is queued; on_timer frees the slot then
    if (esp_timer_stop(slot->handle) == ESP_OK) {
        release(slot);
    }
}

size_t EspTimerScheduler::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

void EspTimerScheduler::on_timer(void* arg)
{
    auto* slot = static_cast<Slot*>(arg);

    bool live;
    {
        std::lock_guard<std::mutex> lock(slot->owner->mutex_);
        live = slot->owner->slots_.erase(slot->id) > 0;
    }

    if (live && slot->task) {
        slot->task();
    }
    release(slot);
}

void EspTimerScheduler::release(Slot* slot)
{
    esp_err_t err = esp_timer_delete(slot->handle);
    if (err != ESP_OK) {
        ESP_LOGW(TAG, "esp_timer_delete failed: %s", esp_err_to_name(err));
    }
    delete slot;
}

} // namespace ancs
