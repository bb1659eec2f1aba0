#include "Scenario.hpp"

#include <iostream>

namespace edgesim
{
    KinematicWorldOptions makeWorldOptions(const SimulationConfig &config)
    {
        KinematicWorldOptions options;
        options.fps = config.fps;
        options.img_width = config.img_width;
        options.img_height = config.img_height;
        options.signal_timing = config.signal_timing;
        return options;
    }

    SchedulerOptions makeSchedulerOptions(const SimulationConfig &config)
    {
        SchedulerOptions options;
        options.reducer = config.reducer;
        options.speed_limit = config.speed_limit;
        options.intersection_radius = config.intersection_radius;
        options.parallel_nodes = config.parallel_nodes;
        options.worker_threads = config.worker_threads;
        return options;
    }

    bool buildScenario(const SimulationConfig &config,
                       KinematicWorld &world,
                       WorldStateStore &store,
                       TickScheduler &scheduler,
                       std::string *error)
    {
        store.setSpawnPoints(config.spawn_points);

        for (const auto &vehicle : config.vehicles)
        {
            const std::string vehicle_id = store.addVehicle(vehicle.model, vehicle.dimensions);
            if (!store.setRoute(vehicle_id, vehicle.route, error))
            {
                return false;
            }

            if (!vehicle.spawn_point.has_value() && vehicle.route.empty())
            {
                if (error)
                    *error = vehicle_id + ": needs a spawn point or a route";
                return false;
            }
            const std::size_t start_index = vehicle.spawn_point.has_value() ? *vehicle.spawn_point : vehicle.route.front();
            if (start_index >= config.spawn_points.size())
            {
                if (error)
                    *error = vehicle_id + ": spawn point " + std::to_string(start_index) + " does not exist";
                return false;
            }

            std::vector<Vec3> path;
            path.reserve(vehicle.route.size());
            for (std::size_t waypoint : vehicle.route)
            {
                path.push_back(config.spawn_points[waypoint]);
            }

            if (!world.spawnVehicle(vehicle_id, config.spawn_points[start_index], path, vehicle.cruise_speed, error))
            {
                return false;
            }

            if (vehicle.camera.has_value())
            {
                const std::string camera_id = store.addCamera(vehicle_id, vehicle.camera->location, vehicle.camera->rotation);
                if (!world.spawnCamera(camera_id, vehicle_id, error))
                {
                    return false;
                }
                scheduler.addNode(vehicle_id, camera_id);
            }
        }

        for (const auto &rsu : config.rsus)
        {
            const std::string rsu_id = store.addRoadsideUnit(rsu.location, rsu.rotation, rsu.dimensions);
            if (!world.spawnStatic(rsu_id, rsu.location, rsu.rotation.yaw, error))
            {
                return false;
            }
            // RSU cameras are fixed in the world, not attached to the RSU actor.
            const std::string camera_id = store.addCamera(std::nullopt, rsu.location, rsu.rotation);
            if (!world.spawnCamera(camera_id, std::nullopt, error))
            {
                return false;
            }
            scheduler.addNode(rsu_id, camera_id);
        }

        for (const auto &pedestrian : config.pedestrians)
        {
            const std::string pedestrian_id = store.addPedestrian(pedestrian.dimensions);
            if (!world.spawnStatic(pedestrian_id, pedestrian.location, 0.0, error))
            {
                return false;
            }
        }

        for (const auto &location : config.intersections)
        {
            store.addIntersection(location);
            world.addSignal(location);
        }

        std::cout << "Scenario: " << store.countEntities(EntityKind::Vehicle) << " vehicles, "
                  << store.countEntities(EntityKind::RoadsideUnit) << " RSUs, "
                  << store.countEntities(EntityKind::Pedestrian) << " pedestrians, "
                  << store.getIntersections().size() << " intersections, "
                  << scheduler.getNodeCount() << " nodes" << std::endl;
        return true;
    }
} // namespace edgesim
