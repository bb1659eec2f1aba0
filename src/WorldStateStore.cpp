#include "WorldStateStore.hpp"

#include <cmath>
#include <utility>

namespace edgesim
{
    namespace
    {
        bool sameRoundedPosition(const Vec3 &a, const Vec3 &b)
        {
            return std::llround(a.x) == std::llround(b.x) && std::llround(a.y) == std::llround(b.y);
        }
    }

    WorldStateStore::WorldStateStore(double ticks_per_second)
        : ticks_per_second(ticks_per_second > 0.0 ? ticks_per_second : 1.0)
    {
    }

    std::string WorldStateStore::registerEntity(Entity entity, const std::string &prefix, uint32_t &counter)
    {
        ++counter;
        entity.id = prefix + std::to_string(counter);
        entity.state.id = entity.id;
        entity.state.is_rsu = entity.isRsu();
        entity_index[entity.id] = entities.size();
        entities.push_back(std::move(entity));
        return entities.back().id;
    }

    std::string WorldStateStore::addVehicle(const std::string &model, const Dimensions &dimensions)
    {
        Entity vehicle;
        vehicle.kind = EntityKind::Vehicle;
        vehicle.model = model;
        vehicle.dimensions = dimensions;
        return registerEntity(std::move(vehicle), "vehicle_", vehicle_counter);
    }

    std::string WorldStateStore::addRoadsideUnit(const Vec3 &location, const Rotation &rotation, const Dimensions &dimensions)
    {
        Entity rsu;
        rsu.kind = EntityKind::RoadsideUnit;
        rsu.model = "rsu";
        rsu.dimensions = dimensions;
        rsu.state.location = location;
        rsu.state.heading = rotation.yaw;
        rsu.has_state = true;
        return registerEntity(std::move(rsu), "rsu_", rsu_counter);
    }

    std::string WorldStateStore::addPedestrian(const Dimensions &dimensions)
    {
        Entity pedestrian;
        pedestrian.kind = EntityKind::Pedestrian;
        pedestrian.model = "walker";
        pedestrian.dimensions = dimensions;
        return registerEntity(std::move(pedestrian), "pedestrian_", pedestrian_counter);
    }

    std::string WorldStateStore::addIntersection(const Vec3 &location)
    {
        Intersection intersection;
        intersection.id = "intersection_" + std::to_string(intersections.size() + 1);
        intersection.location = location;
        intersections.push_back(intersection);
        return intersections.back().id;
    }

    std::string WorldStateStore::addCamera(const std::optional<std::string> &parent_id, const Vec3 &location, const Rotation &rotation)
    {
        Sensor sensor;
        sensor.id = "camera_" + std::to_string(sensors.size() + 1);
        sensor.parent_id = parent_id;
        sensor.location = location;
        sensor.rotation = rotation;
        sensors.push_back(sensor);
        return sensors.back().id;
    }

    void WorldStateStore::setSpawnPoints(std::vector<Vec3> points)
    {
        spawn_points = std::move(points);
    }

    bool WorldStateStore::setRoute(const std::string &entity_id, std::vector<std::size_t> route, std::string *error)
    {
        Entity *entity = findMutableEntity(entity_id);
        if (!entity)
        {
            if (error)
                *error = "unknown entity: " + entity_id;
            return false;
        }
        if (!entity->isVehicle())
        {
            if (error)
                *error = "only vehicles can follow a route: " + entity_id;
            return false;
        }
        for (std::size_t index : route)
        {
            if (index >= spawn_points.size())
            {
                if (error)
                    *error = "route waypoint " + std::to_string(index) + " is outside the spawn point list";
                return false;
            }
        }

        entity->route = std::move(route);
        return true;
    }

    bool WorldStateStore::setEntityState(const EntityState &state)
    {
        Entity *entity = findMutableEntity(state.id);
        if (!entity)
        {
            return false;
        }

        entity->state = state;
        entity->state.is_rsu = entity->isRsu();
        entity->has_state = true;
        return true;
    }

    std::vector<std::string> WorldStateStore::updateFromSimulator(const IWorldSimulator &simulator)
    {
        std::vector<std::string> missing;
        for (const auto &entity : entities)
        {
            std::optional<EntityState> state = simulator.entityPoseVelocity(entity.id);
            if (!state.has_value())
            {
                missing.push_back(entity.id);
                continue;
            }
            state->id = entity.id;
            setEntityState(*state);
        }
        return missing;
    }

    void WorldStateStore::advanceTravelAccounting()
    {
        for (auto &entity : entities)
        {
            if (!entity.isVehicle() || !entity.hasDestination() || !entity.has_state)
            {
                continue;
            }
            if (entity.reached_destination)
            {
                continue;
            }

            const std::size_t destination_index = entity.destinationIndex();
            if (destination_index >= spawn_points.size())
            {
                continue;
            }

            if (sameRoundedPosition(entity.state.location, spawn_points[destination_index]))
            {
                entity.reached_destination = true;
            }
            else
            {
                entity.travelled_frames++;
            }
        }
    }

    std::optional<double> WorldStateStore::travelTime(const std::string &entity_id) const
    {
        const Entity *entity = findEntity(entity_id);
        if (!entity || !entity->isVehicle())
        {
            return std::nullopt;
        }
        return static_cast<double>(entity->travelled_frames) / ticks_per_second;
    }

    std::map<std::string, double> WorldStateStore::travelTimes() const
    {
        std::map<std::string, double> times;
        for (const auto &entity : entities)
        {
            if (entity.isVehicle())
            {
                times[entity.id] = static_cast<double>(entity.travelled_frames) / ticks_per_second;
            }
        }
        return times;
    }

    bool WorldStateStore::recordCongestionSample(const std::string &intersection_id, bool congested)
    {
        for (auto &intersection : intersections)
        {
            if (intersection.id != intersection_id)
            {
                continue;
            }
            intersection.sampled_ticks++;
            if (congested)
            {
                intersection.congestion_ticks++;
            }
            return true;
        }
        return false;
    }

    std::optional<double> WorldStateStore::congestionRatio(const std::string &intersection_id) const
    {
        const Intersection *intersection = findIntersection(intersection_id);
        if (!intersection)
        {
            return std::nullopt;
        }
        return intersection->congestionRatio();
    }

    const Entity *WorldStateStore::findEntity(const std::string &entity_id) const
    {
        auto it = entity_index.find(entity_id);
        return it == entity_index.end() ? nullptr : &entities[it->second];
    }

    Entity *WorldStateStore::findMutableEntity(const std::string &entity_id)
    {
        auto it = entity_index.find(entity_id);
        return it == entity_index.end() ? nullptr : &entities[it->second];
    }

    const Intersection *WorldStateStore::findIntersection(const std::string &intersection_id) const
    {
        for (const auto &intersection : intersections)
        {
            if (intersection.id == intersection_id)
                return &intersection;
        }
        return nullptr;
    }

    const Sensor *WorldStateStore::findSensor(const std::string &sensor_id) const
    {
        for (const auto &sensor : sensors)
        {
            if (sensor.id == sensor_id)
                return &sensor;
        }
        return nullptr;
    }

    std::size_t WorldStateStore::countEntities(EntityKind kind) const
    {
        std::size_t count = 0;
        for (const auto &entity : entities)
        {
            if (entity.kind == kind)
                count++;
        }
        return count;
    }

} // namespace edgesim
