#include "serial_context.hpp"

#include <utility>

namespace ancs {

void SerialContext::set_exit_hook(Hook hook)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    exit_hook_ = std::move(hook);
}

void SerialContext::run(const std::function<void()>& fn)
{
    std::unique_lock<std::recursive_mutex> lock(mutex_);

    // Restores the depth on every exit, including a throwing fn.
    struct DepthGuard {
        uint32_t& depth;
        explicit DepthGuard(uint32_t& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
    };

    Hook hook;
    {
        DepthGuard guard(depth_);
        fn();
        if (depth_ == 1) {
            hook = exit_hook_;
        }
    }
    lock.unlock();

    if (hook) {
        hook();
    }
}

} // namespace ancs
