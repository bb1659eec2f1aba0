#include "TrafficAnalytics.hpp"

namespace edgesim
{

    TrafficAnalytics::TrafficAnalytics(const IWorldSimulator &simulator, double radius)
        : simulator(simulator), radius(radius)
    {
    }

    std::optional<double> TrafficAnalytics::averageApproachVelocity(const WorldStateStore &store,
                                                                    const Intersection &intersection) const
    {
        double speed_sum = 0.0;
        std::size_t qualifying = 0;

        for (const auto &entity : store.getEntities())
        {
            if (!entity.isVehicle() || !entity.has_state)
            {
                continue;
            }
            if (distance(entity.state.location, intersection.location) >= radius)
            {
                continue;
            }
            if (simulator.trafficSignalState(entity.id) != LightState::Green)
            {
                continue;
            }

            speed_sum += entity.state.planarSpeedKmh();
            qualifying++;
        }

        if (qualifying == 0)
        {
            return std::nullopt;
        }
        return speed_sum / static_cast<double>(qualifying);
    }

    bool TrafficAnalytics::isCongested(const std::optional<double> &average_kmh, double speed_limit)
    {
        return average_kmh.has_value() && *average_kmh < CONGESTION_FRACTION * speed_limit;
    }

    std::size_t TrafficAnalytics::updateCongestion(WorldStateStore &store, double speed_limit) const
    {
        std::size_t congested_count = 0;
        for (const auto &intersection : store.getIntersections())
        {
            const bool congested = isCongested(averageApproachVelocity(store, intersection), speed_limit);
            if (congested)
            {
                congested_count++;
            }
            store.recordCongestionSample(intersection.id, congested);
        }
        return congested_count;
    }

} // namespace edgesim
