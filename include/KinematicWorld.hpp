#pragma once

#include "SignalController.hpp"
#include "WorldSimulator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgesim
{
    struct KinematicWorldOptions
    {
        double fps = 10.0;
        uint32_t img_width = 640;
        uint32_t img_height = 480;
        SignalTiming signal_timing;
        double signal_radius = 30.0;   // a signal governs vehicles closer than this
        double stop_distance = 20.0;   // vehicles hold inside this distance on red/orange
        double box_half_width = 8.0;   // vehicles already inside the box keep going
        double acceleration = 3.0;     // m/s^2
    };

    // Reference world: vehicles drive straight segments between waypoints at a
    // cruise speed and hold before a signal that is not green. Frames carry
    // geometry and timing only; nothing is rendered.
    class KinematicWorld : public IWorldSimulator
    {
    public:
        explicit KinematicWorld(KinematicWorldOptions options = KinematicWorldOptions{});

        bool spawnVehicle(const std::string &actor_id,
                          const Vec3 &location,
                          std::vector<Vec3> path,
                          double cruise_speed,
                          std::string *error = nullptr);
        bool spawnStatic(const std::string &actor_id, const Vec3 &location, double heading, std::string *error = nullptr);
        bool spawnCamera(const std::string &sensor_id, const std::optional<std::string> &parent_id, std::string *error = nullptr);
        void addSignal(const Vec3 &location);

        void setCameraEnabled(const std::string &sensor_id, bool enabled);
        std::size_t getLiveActorCount() const;
        const KinematicWorldOptions &getOptions() const { return options; }

        uint64_t currentTick() const override { return tick; }
        std::optional<EntityState> entityPoseVelocity(const std::string &entity_id) const override;
        std::optional<CameraFrame> cameraFrame(const std::string &sensor_id) const override;
        LightState trafficSignalState(const std::string &entity_id) const override;
        void advanceOneTick() override;
        bool releaseActor(const std::string &actor_id, std::string *error = nullptr) override;

    private:
        struct Actor
        {
            std::string id;
            bool mobile = false;
            bool released = false;
            Vec3 location;
            Vec3 direction; // unit, planar
            double heading = 0.0;
            double speed = 0.0;
            double cruise_speed = 0.0;
            std::vector<Vec3> path;
            std::size_t next_waypoint = 0;
        };

        struct Camera
        {
            std::string id;
            std::optional<std::string> parent_id;
            bool enabled = true;
            bool released = false;
        };

        struct Signal
        {
            Vec3 location;
            SignalController controller;
        };

        const Actor *findActor(const std::string &actor_id) const;
        const Signal *governingSignal(const Actor &actor) const;
        SignalAxis axisOf(const Actor &actor) const;
        bool shouldHold(const Actor &actor) const;
        void updateSpeed(Actor &actor, double target_speed, double dt_seconds) const;
        void stepVehicle(Actor &actor, double dt_seconds);

        KinematicWorldOptions options;
        uint64_t tick = 0;
        std::vector<Actor> actors;
        std::unordered_map<std::string, std::size_t> actor_index;
        std::vector<Camera> cameras;
        std::vector<Signal> signals;
    };

} // namespace edgesim
