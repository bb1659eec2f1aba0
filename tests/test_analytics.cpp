#include <catch2/catch.hpp>
#include "TrafficAnalytics.hpp"
#include "TestWorld.hpp"

using namespace edgesim;

namespace
{
    constexpr double KMH = 1.0 / 3.6;

    void place(WorldStateStore &store, test::FakeWorld &world, const std::string &id, double x, double y, double speed_kmh)
    {
        world.states[id] = test::makeState(id, x, y, speed_kmh * KMH, 0.0);
        store.updateFromSimulator(world);
    }
}

TEST_CASE("No qualifying vehicle gives no average and no congestion", "analytics")
{
    test::FakeWorld world;
    WorldStateStore store;
    const std::string intersection = store.addIntersection(Vec3{});
    TrafficAnalytics analytics(world);

    REQUIRE_FALSE(analytics.averageApproachVelocity(store, *store.findIntersection(intersection)).has_value());
    REQUIRE_FALSE(TrafficAnalytics::isCongested(std::nullopt, 30.0));

    REQUIRE(analytics.updateCongestion(store) == 0);
    REQUIRE(store.findIntersection(intersection)->sampled_ticks == 1);
    REQUIRE(store.findIntersection(intersection)->congestion_ticks == 0);
}

TEST_CASE("Average covers vehicles inside the radius on green", "analytics")
{
    test::FakeWorld world;
    WorldStateStore store;
    const std::string intersection = store.addIntersection(Vec3{});
    const std::string a = store.addVehicle("vehicle.a", Dimensions{});
    const std::string b = store.addVehicle("vehicle.b", Dimensions{});
    const std::string far = store.addVehicle("vehicle.c", Dimensions{});
    const std::string stopped = store.addVehicle("vehicle.d", Dimensions{});
    const std::string walker = store.addPedestrian(Dimensions{});

    place(store, world, a, 10, 0, 10.0);
    place(store, world, b, 0, -20, 20.0);
    place(store, world, far, 50, 0, 90.0); // exactly on the radius
    place(store, world, stopped, 5, 0, 0.0);
    place(store, world, walker, 1, 1, 5.0);
    world.signals[stopped] = LightState::Red;

    TrafficAnalytics analytics(world, 50.0);
    auto average = analytics.averageApproachVelocity(store, *store.findIntersection(intersection));
    REQUIRE(average.has_value());
    REQUIRE(*average == Catch::Detail::Approx(15.0));
}

TEST_CASE("Congestion is strictly below half the speed limit", "analytics")
{
    REQUIRE(TrafficAnalytics::isCongested(14.0, 30.0));
    REQUIRE_FALSE(TrafficAnalytics::isCongested(15.0, 30.0));
    REQUIRE_FALSE(TrafficAnalytics::isCongested(16.0, 30.0));
    REQUIRE(TrafficAnalytics::isCongested(0.0, 30.0));
}

TEST_CASE("Every intersection is sampled once per update", "analytics")
{
    test::FakeWorld world;
    WorldStateStore store;
    const std::string busy = store.addIntersection(Vec3{0, 0, 0});
    const std::string quiet = store.addIntersection(Vec3{500, 0, 0});
    const std::string slow = store.addVehicle("vehicle.a", Dimensions{});
    place(store, world, slow, 5, 0, 7.2);

    TrafficAnalytics analytics(world);
    REQUIRE(analytics.updateCongestion(store, 30.0) == 1);
    REQUIRE(analytics.updateCongestion(store, 30.0) == 1);

    REQUIRE(store.congestionRatio(busy).value() == Catch::Detail::Approx(1.0));
    REQUIRE(store.congestionRatio(quiet).value() == 0.0);
    REQUIRE(store.findIntersection(quiet)->sampled_ticks == 2);
}

TEST_CASE("Updates count 14 km/h as congested and 16 km/h as free flow", "analytics")
{
    test::FakeWorld world;
    WorldStateStore store;
    const std::string slow_junction = store.addIntersection(Vec3{0, 0, 0});
    const std::string fast_junction = store.addIntersection(Vec3{1000, 0, 0});
    const std::string slow = store.addVehicle("vehicle.a", Dimensions{});
    const std::string fast = store.addVehicle("vehicle.b", Dimensions{});
    place(store, world, slow, 5, 0, 14.0);
    place(store, world, fast, 1005, 0, 16.0);

    TrafficAnalytics analytics(world);
    REQUIRE(analytics.updateCongestion(store, 30.0) == 1);

    REQUIRE(store.findIntersection(slow_junction)->congestion_ticks == 1);
    REQUIRE(store.findIntersection(slow_junction)->sampled_ticks == 1);
    REQUIRE(store.findIntersection(fast_junction)->congestion_ticks == 0);
    REQUIRE(store.findIntersection(fast_junction)->sampled_ticks == 1);
}
