#include <catch2/catch.hpp>
#include "KinematicWorld.hpp"
#include "SignalController.hpp"

using namespace edgesim;

TEST_CASE("Signal cycles NS green, NS orange, EW green, EW orange", "signal")
{
    SignalController signal(SignalTiming{10.0, 2.0});
    REQUIRE(signal.getState(SignalAxis::NorthSouth) == LightState::Green);
    REQUIRE(signal.getState(SignalAxis::EastWest) == LightState::Red);

    signal.tick(10.0);
    REQUIRE(signal.getState(SignalAxis::NorthSouth) == LightState::Orange);
    REQUIRE(signal.getState(SignalAxis::EastWest) == LightState::Red);

    signal.tick(2.0);
    REQUIRE(signal.getState(SignalAxis::NorthSouth) == LightState::Red);
    REQUIRE(signal.getState(SignalAxis::EastWest) == LightState::Green);

    // One large step crosses several phases
    signal.tick(11.0);
    REQUIRE(signal.getState(SignalAxis::EastWest) == LightState::Orange);
    signal.tick(1.0);
    REQUIRE(signal.getState(SignalAxis::NorthSouth) == LightState::Green);

    signal.tick(5.0);
    signal.reset();
    REQUIRE(signal.getState(SignalAxis::NorthSouth) == LightState::Green);
}

TEST_CASE("Zero orange goes straight to the other green", "signal")
{
    SignalController signal(SignalTiming{5.0, 0.0});
    signal.tick(5.0);
    REQUIRE(signal.getState(SignalAxis::EastWest) == LightState::Green);
    signal.tick(5.0);
    REQUIRE(signal.getState(SignalAxis::NorthSouth) == LightState::Green);
}

TEST_CASE("Vehicles follow their path and park at the end", "kinematic_world")
{
    KinematicWorldOptions options;
    options.acceleration = 100.0;
    KinematicWorld world(options);

    REQUIRE(world.spawnVehicle("vehicle_1", Vec3{0, 0, 0}, {Vec3{10, 0, 0}, Vec3{10, 10, 0}}, 5.0));
    auto start = world.entityPoseVelocity("vehicle_1");
    REQUIRE(start.has_value());
    REQUIRE(start->heading == Catch::Detail::Approx(0.0));
    REQUIRE(start->planarSpeed() == 0.0);

    world.advanceOneTick();
    auto moving = world.entityPoseVelocity("vehicle_1");
    REQUIRE(moving->tick == 1);
    REQUIRE(moving->location.x == Catch::Detail::Approx(0.5));
    REQUIRE(moving->planarSpeed() == Catch::Detail::Approx(5.0));

    for (int i = 0; i < 60; ++i)
        world.advanceOneTick();

    auto parked = world.entityPoseVelocity("vehicle_1");
    REQUIRE(parked->location.x == Catch::Detail::Approx(10.0));
    REQUIRE(parked->location.y == Catch::Detail::Approx(10.0));
    REQUIRE(parked->planarSpeed() == 0.0);
    REQUIRE(parked->heading == Catch::Detail::Approx(90.0));
}

TEST_CASE("Vehicles hold before a signal that is not green", "kinematic_world")
{
    KinematicWorldOptions options;
    options.acceleration = 100.0;
    options.signal_timing = SignalTiming{100.0, 2.0};
    KinematicWorld world(options);
    world.addSignal(Vec3{0, 0, 0});

    // Eastbound traffic faces red while north-south is green
    REQUIRE(world.spawnVehicle("vehicle_1", Vec3{-15, 0, 0}, {Vec3{30, 0, 0}}, 8.0));
    REQUIRE(world.spawnVehicle("vehicle_2", Vec3{0, -15, 0}, {Vec3{0, 30, 0}}, 8.0));
    REQUIRE(world.trafficSignalState("vehicle_1") == LightState::Red);
    REQUIRE(world.trafficSignalState("vehicle_2") == LightState::Green);

    for (int i = 0; i < 20; ++i)
        world.advanceOneTick();

    REQUIRE(world.entityPoseVelocity("vehicle_1")->location.x == Catch::Detail::Approx(-15.0));
    REQUIRE(world.entityPoseVelocity("vehicle_2")->location.y > 0.0);
}

TEST_CASE("Static actors and unknown ids report no signal", "kinematic_world")
{
    KinematicWorld world;
    world.addSignal(Vec3{0, 0, 0});
    REQUIRE(world.spawnStatic("rsu_1", Vec3{1, 1, 6}, 225.0));

    auto rsu = world.entityPoseVelocity("rsu_1");
    REQUIRE(rsu->heading == 225.0);
    REQUIRE(rsu->location.z == 6.0);
    REQUIRE(world.trafficSignalState("rsu_1") == LightState::Green);
    REQUIRE(world.trafficSignalState("ghost") == LightState::Green);
    REQUIRE_FALSE(world.entityPoseVelocity("ghost").has_value());

    std::string error;
    REQUIRE_FALSE(world.spawnStatic("rsu_1", Vec3{}, 0.0, &error));
    REQUIRE(error.find("already in use") != std::string::npos);
}

TEST_CASE("Cameras follow their parent's lifetime", "kinematic_world")
{
    KinematicWorldOptions options;
    options.img_width = 800;
    options.img_height = 600;
    KinematicWorld world(options);
    REQUIRE(world.spawnVehicle("vehicle_1", Vec3{}, {}, 5.0));
    REQUIRE(world.spawnCamera("camera_1", std::string("vehicle_1")));
    REQUIRE(world.spawnCamera("camera_2", std::nullopt));

    std::string error;
    REQUIRE_FALSE(world.spawnCamera("camera_3", std::string("vehicle_9"), &error));
    REQUIRE_FALSE(world.cameraFrame("camera_3").has_value());

    world.advanceOneTick();
    auto frame = world.cameraFrame("camera_1");
    REQUIRE(frame.has_value());
    REQUIRE(frame->tick == 1);
    REQUIRE(frame->width == 800);
    REQUIRE(frame->height == 600);

    world.setCameraEnabled("camera_2", false);
    REQUIRE_FALSE(world.cameraFrame("camera_2").has_value());

    REQUIRE(world.releaseActor("vehicle_1"));
    REQUIRE_FALSE(world.cameraFrame("camera_1").has_value());
    REQUIRE_FALSE(world.entityPoseVelocity("vehicle_1").has_value());
    REQUIRE(world.getLiveActorCount() == 2);
}

TEST_CASE("Releasing twice or releasing unknown actors fails", "kinematic_world")
{
    KinematicWorld world;
    REQUIRE(world.spawnStatic("pedestrian_1", Vec3{}, 0.0));
    REQUIRE(world.spawnCamera("camera_1", std::nullopt));

    std::string error;
    REQUIRE(world.releaseActor("camera_1", &error));
    REQUIRE_FALSE(world.releaseActor("camera_1", &error));
    REQUIRE(error.find("already released") != std::string::npos);
    REQUIRE(world.releaseActor("pedestrian_1", &error));
    REQUIRE_FALSE(world.releaseActor("pedestrian_1", &error));
    REQUIRE_FALSE(world.releaseActor("vehicle_42", &error));
    REQUIRE(error.find("unknown") != std::string::npos);
    REQUIRE(world.getLiveActorCount() == 0);
}
