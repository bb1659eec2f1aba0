#pragma once

#include "Entity.hpp"
#include "Intersection.hpp"
#include "WorldSimulator.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgesim
{

    class WorldStateStore
    {
    public:
        explicit WorldStateStore(double ticks_per_second = 10.0);

        // Registration. Ids are sequential per category and never reused.
        std::string addVehicle(const std::string &model, const Dimensions &dimensions);
        std::string addRoadsideUnit(const Vec3 &location, const Rotation &rotation, const Dimensions &dimensions);
        std::string addPedestrian(const Dimensions &dimensions);
        std::string addIntersection(const Vec3 &location);
        std::string addCamera(const std::optional<std::string> &parent_id, const Vec3 &location, const Rotation &rotation);

        void setSpawnPoints(std::vector<Vec3> points);
        const std::vector<Vec3> &getSpawnPoints() const { return spawn_points; }

        // Route indices refer to the spawn points; the last one is the destination.
        bool setRoute(const std::string &entity_id, std::vector<std::size_t> route, std::string *error = nullptr);

        // Pose refresh, driven by the clock-advance step only.
        bool setEntityState(const EntityState &state);
        std::vector<std::string> updateFromSimulator(const IWorldSimulator &simulator);

        // Must run exactly once per tick.
        void advanceTravelAccounting();

        std::optional<double> travelTime(const std::string &entity_id) const;
        std::map<std::string, double> travelTimes() const;

        bool recordCongestionSample(const std::string &intersection_id, bool congested);
        std::optional<double> congestionRatio(const std::string &intersection_id) const;

        const Entity *findEntity(const std::string &entity_id) const;
        const Intersection *findIntersection(const std::string &intersection_id) const;
        const Sensor *findSensor(const std::string &sensor_id) const;

        const std::vector<Entity> &getEntities() const { return entities; }
        const std::vector<Intersection> &getIntersections() const { return intersections; }
        const std::vector<Sensor> &getSensors() const { return sensors; }
        std::size_t countEntities(EntityKind kind) const;
        double getTicksPerSecond() const { return ticks_per_second; }

    private:
        std::string registerEntity(Entity entity, const std::string &prefix, uint32_t &counter);
        Entity *findMutableEntity(const std::string &entity_id);

        double ticks_per_second;
        std::vector<Vec3> spawn_points;

        std::vector<Entity> entities;
        std::unordered_map<std::string, std::size_t> entity_index;
        std::vector<Intersection> intersections;
        std::vector<Sensor> sensors;

        uint32_t vehicle_counter = 0;
        uint32_t rsu_counter = 0;
        uint32_t pedestrian_counter = 0;
    };

} // namespace edgesim
