#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace edgesim
{
    struct Vec3
    {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;
    };

    inline double distance(const Vec3 &a, const Vec3 &b)
    {
        const double dx = a.x - b.x;
        const double dy = a.y - b.y;
        const double dz = a.z - b.z;
        return std::sqrt(dx * dx + dy * dy + dz * dz);
    }

    struct Rotation
    {
        double pitch = 0.0; // degrees
        double yaw = 0.0;   // degrees
        double roll = 0.0;  // degrees
    };

    struct Dimensions
    {
        double length = 0.0; // meters
        double width = 0.0;
        double height = 0.0;
    };

    enum class EntityKind
    {
        Vehicle,
        RoadsideUnit,
        Pedestrian
    };

    // Pose and velocity of one entity as observed at one tick.
    struct EntityState
    {
        std::string id;
        uint64_t tick = 0;
        bool is_rsu = false;
        Vec3 location;
        Vec3 velocity;        // m/s
        double heading = 0.0; // yaw, degrees

        double planarSpeed() const { return std::hypot(velocity.x, velocity.y); }
        double planarSpeedKmh() const { return planarSpeed() * 3.6; }
    };

    struct Entity
    {
        std::string id;
        EntityKind kind = EntityKind::Vehicle;
        std::string model;
        Dimensions dimensions;
        std::vector<std::size_t> route; // waypoint indices, last one is the destination
        uint64_t travelled_frames = 0;
        bool reached_destination = false;
        bool has_state = false; // false until the first pose refresh
        EntityState state;

        bool isRsu() const { return kind == EntityKind::RoadsideUnit; }
        bool isVehicle() const { return kind == EntityKind::Vehicle; }
        bool hasDestination() const { return !route.empty(); }
        std::size_t destinationIndex() const { return route.back(); }
    };

} // namespace edgesim
