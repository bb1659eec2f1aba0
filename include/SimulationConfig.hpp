#pragma once

#include "DetectionReducer.hpp"
#include "Entity.hpp"
#include "SignalController.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace edgesim
{
    struct CameraMountConfig
    {
        Vec3 location{1.5, 0.0, 2.4}; // relative to the parent vehicle
        Rotation rotation;
    };

    struct VehicleConfig
    {
        std::string model = "vehicle.generic";
        std::optional<std::size_t> spawn_point; // defaults to the first route waypoint
        std::vector<std::size_t> route;
        double cruise_speed = 8.0; // m/s
        Dimensions dimensions{4.5, 1.8, 1.5};
        std::optional<CameraMountConfig> camera = CameraMountConfig{};
    };

    struct RoadsideUnitConfig
    {
        Vec3 location;
        Rotation rotation;
        Dimensions dimensions{0.5, 0.5, 6.0};
    };

    struct PedestrianConfig
    {
        Vec3 location;
        Dimensions dimensions{0.4, 0.4, 1.8};
    };

    struct SimulationConfig
    {
        std::string map_name = "Town10";
        uint32_t img_width = 640;
        uint32_t img_height = 480;
        uint64_t n_frames = 600;
        double fps = 10.0;

        double speed_limit = 30.0;          // km/h
        double intersection_radius = 50.0;  // meters
        ReducerConfig reducer;
        SignalTiming signal_timing;

        bool parallel_nodes = false;
        std::size_t worker_threads = 4;

        int http_port = 0;            // 0 disables the HTTP view
        std::string database_path;    // empty disables persistence
        std::string detections_file;  // replayed perception output

        std::vector<Vec3> spawn_points;
        std::vector<VehicleConfig> vehicles;
        std::vector<RoadsideUnitConfig> rsus;
        std::vector<Vec3> intersections;
        std::vector<PedestrianConfig> pedestrians;
    };

    // Two vehicles crossing one signalised intersection, watched by one RSU.
    inline SimulationConfig makeDefaultSimulationConfig()
    {
        SimulationConfig config;

        config.spawn_points = {
            {-120.0, 0.0, 0.0},
            {-40.0, 0.0, 0.0},
            {60.0, 0.0, 0.0},
            {0.0, -120.0, 0.0},
            {0.0, -40.0, 0.0},
            {0.0, 80.0, 0.0}};

        VehicleConfig east_bound;
        east_bound.model = "vehicle.tesla.model3";
        east_bound.spawn_point = 0;
        east_bound.route = {1, 2};
        east_bound.cruise_speed = 8.0;

        VehicleConfig north_bound;
        north_bound.model = "vehicle.audi.a2";
        north_bound.spawn_point = 3;
        north_bound.route = {4, 5};
        north_bound.cruise_speed = 7.0;

        config.vehicles = {east_bound, north_bound};

        RoadsideUnitConfig rsu;
        rsu.location = {10.0, 10.0, 6.0};
        rsu.rotation = {-20.0, 225.0, 0.0};
        config.rsus = {rsu};

        config.intersections = {{0.0, 0.0, 0.0}};
        config.pedestrians = {{{6.0, 6.0, 0.0}, Dimensions{0.4, 0.4, 1.8}}};
        return config;
    }

} // namespace edgesim
