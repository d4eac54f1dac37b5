#include <catch2/catch_test_macros.hpp>

#include "engine/FrameScheduler.hpp"

#include <vector>

using engine::FrameScheduler;

TEST_CASE("FrameScheduler runs every registration once per tick", "[frame_scheduler]")
{
    FrameScheduler scheduler;
    int a = 0;
    int b = 0;
    auto ha = scheduler.add([&](engine::TimePoint) { ++a; });
    auto hb = scheduler.add([&](engine::TimePoint) { ++b; });

    REQUIRE(ha != FrameScheduler::kInvalidHandle);
    REQUIRE(ha != hb);
    REQUIRE(scheduler.size() == 2);

    scheduler.tick({});
    scheduler.tick({});
    REQUIRE(a == 2);
    REQUIRE(b == 2);
    REQUIRE(scheduler.tickCount() == 2);

    REQUIRE(scheduler.remove(ha));
    REQUIRE_FALSE(scheduler.remove(ha));
    scheduler.tick({});
    REQUIRE(a == 2);
    REQUIRE(b == 3);
}

TEST_CASE("FrameScheduler rejects empty callbacks", "[frame_scheduler]")
{
    FrameScheduler scheduler;
    REQUIRE(scheduler.add({}) == FrameScheduler::kInvalidHandle);
    REQUIRE(scheduler.size() == 0);
}

TEST_CASE("FrameScheduler tolerates changes during a tick", "[frame_scheduler]")
{
    FrameScheduler scheduler;
    std::vector<int> order;

    SECTION("a callback removing itself")
    {
        FrameScheduler::Handle self = FrameScheduler::kInvalidHandle;
        self = scheduler.add([&](engine::TimePoint) {
            order.push_back(1);
            scheduler.remove(self);
        });
        scheduler.add([&](engine::TimePoint) { order.push_back(2); });

        scheduler.tick({});
        scheduler.tick({});
        REQUIRE(order == std::vector<int>{ 1, 2, 2 });
        REQUIRE_FALSE(scheduler.contains(self));
    }

    SECTION("a callback removing a later one skips it immediately")
    {
        FrameScheduler::Handle later = FrameScheduler::kInvalidHandle;
        scheduler.add([&](engine::TimePoint) {
            order.push_back(1);
            scheduler.remove(later);
        });
        later = scheduler.add([&](engine::TimePoint) { order.push_back(2); });

        scheduler.tick({});
        REQUIRE(order == std::vector<int>{ 1 });
        REQUIRE(scheduler.size() == 1);
    }

    SECTION("a callback adding another runs it from the next tick")
    {
        bool added = false;
        scheduler.add([&](engine::TimePoint) {
            order.push_back(1);
            if (!added) {
                added = true;
                scheduler.add([&](engine::TimePoint) { order.push_back(2); });
            }
        });

        scheduler.tick({});
        REQUIRE(order == std::vector<int>{ 1 });
        scheduler.tick({});
        REQUIRE(order == std::vector<int>{ 1, 1, 2 });
    }
}
