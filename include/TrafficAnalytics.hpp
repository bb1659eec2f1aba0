#pragma once

#include "Intersection.hpp"
#include "WorldSimulator.hpp"
#include "WorldStateStore.hpp"

#include <optional>

namespace edgesim
{

    class TrafficAnalytics
    {
    public:
        static constexpr double DEFAULT_RADIUS = 50.0;       // meters
        static constexpr double DEFAULT_SPEED_LIMIT = 30.0;  // km/h
        static constexpr double CONGESTION_FRACTION = 0.5;   // of the speed limit

        explicit TrafficAnalytics(const IWorldSimulator &simulator, double radius = DEFAULT_RADIUS);

        // Mean planar speed (km/h) of vehicles within the radius whose signal is green.
        // Empty when no vehicle qualifies; callers treat that as not congested.
        std::optional<double> averageApproachVelocity(const WorldStateStore &store,
                                                      const Intersection &intersection) const;

        // Samples every intersection once. Returns how many were congested this tick.
        std::size_t updateCongestion(WorldStateStore &store, double speed_limit = DEFAULT_SPEED_LIMIT) const;

        static bool isCongested(const std::optional<double> &average_kmh, double speed_limit);

        double getRadius() const { return radius; }

    private:
        const IWorldSimulator &simulator;
        double radius;
    };

} // namespace edgesim
