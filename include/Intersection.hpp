#pragma once

#include "Entity.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace edgesim
{

    enum class LightState
    {
        Red,
        Orange,
        Green
    };

    struct Intersection
    {
        std::string id;
        Vec3 location;
        uint64_t congestion_ticks = 0; // ticks sampled below the congestion threshold
        uint64_t sampled_ticks = 0;    // ticks sampled in total

        double congestionRatio() const
        {
            if (sampled_ticks == 0)
                return 0.0;
            return static_cast<double>(congestion_ticks) / static_cast<double>(sampled_ticks);
        }
    };

    // Camera. Attached cameras store their mount offset relative to the parent,
    // fixed cameras store their world pose.
    struct Sensor
    {
        std::string id;
        std::optional<std::string> parent_id;
        Vec3 location;
        Rotation rotation;

        bool isFixed() const { return !parent_id.has_value(); }
    };

} // namespace edgesim
