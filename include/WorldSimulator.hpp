#pragma once

#include "Entity.hpp"
#include "Intersection.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace edgesim
{
    struct CameraFrame
    {
        std::string sensor_id;
        uint64_t tick = 0;
        uint32_t width = 0;
        uint32_t height = 0;
        std::vector<uint8_t> pixels; // RGB8, row-major; may be empty when the world does not render
    };

    // The world the simulation runs against. Owns actors, physics stepping
    // and camera rendering; edgesim only reads from it and advances it.
    class IWorldSimulator
    {
    public:
        virtual ~IWorldSimulator() = default;

        virtual uint64_t currentTick() const = 0;
        virtual std::optional<EntityState> entityPoseVelocity(const std::string &entity_id) const = 0;
        virtual std::optional<CameraFrame> cameraFrame(const std::string &sensor_id) const = 0;

        // Signal governing the entity. Entities not affected by any signal report Green.
        virtual LightState trafficSignalState(const std::string &entity_id) const = 0;

        virtual void advanceOneTick() = 0;
        virtual bool releaseActor(const std::string &actor_id, std::string *error = nullptr) = 0;
    };

} // namespace edgesim
