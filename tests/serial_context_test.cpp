#include <stdexcept>
#include <thread>

#include "serial_context.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace ancs;

TEST_CASE("the exit hook runs once, after the outermost call")
{
    SerialContext context;
    int hooks = 0;
    int hooks_seen_inside = -1;
    context.set_exit_hook([&] { ++hooks; });

    context.run([&] {
        context.run([&] {});
        hooks_seen_inside = hooks;
    });

    CHECK(hooks_seen_inside == 0);
    CHECK(hooks == 1);
}

TEST_CASE("the exit hook runs with the context released")
{
    SerialContext context;
    bool lockable_from_other_thread = false;
    context.set_exit_hook([&] {
        std::thread other([&] {
            lockable_from_other_thread = context.mutex().try_lock();
            if (lockable_from_other_thread) {
                context.mutex().unlock();
            }
        });
        other.join();
    });

    context.run([] {});
    CHECK(lockable_from_other_thread);
}

TEST_CASE("a throwing call leaves the context usable")
{
    SerialContext context;
    int hooks = 0;
    context.set_exit_hook([&] { ++hooks; });

    CHECK_THROWS_AS(context.run([] { throw std::runtime_error("callback failed"); }),
                    std::runtime_error);
    CHECK(hooks == 0);

    CHECK_THROWS_AS(context.run([&] {
                        context.run([] { throw std::runtime_error("nested failure"); });
                    }),
                    std::runtime_error);
    CHECK(hooks == 0);

    context.run([] {});
    CHECK(hooks == 1);

    std::thread other([&] { context.run([] {}); });
    other.join();
    CHECK(hooks == 2);
}
