/**
 * @file serial_context.hpp
 * @brief Single logical execution context shared by the engine components
 *
 * Caller APIs, transport completions and timer callbacks all enter through
 * run(), which serializes them on one recursive mutex. When the outermost
 * run() returns, the exit hook is invoked with the mutex released; the
 * engine uses it to publish the events produced meanwhile.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace ancs {

class SerialContext {
public:
    using Hook = std::function<void()>;

    SerialContext() = default;

    SerialContext(const SerialContext&) = delete;
    SerialContext& operator=(const SerialContext&) = delete;

    void set_exit_hook(Hook hook);

    void run(const std::function<void()>& fn);

    /**
     * @brief Direct access for short reads that produce no events
     */
    std::recursive_mutex& mutex() { return mutex_; }

private:
    std::recursive_mutex mutex_;
    uint32_t depth_{0};
    Hook exit_hook_;
};

} // namespace ancs
