#pragma once

#include "KinematicWorld.hpp"
#include "SimulationConfig.hpp"
#include "TickScheduler.hpp"
#include "WorldStateStore.hpp"

#include <string>

namespace edgesim
{
    KinematicWorldOptions makeWorldOptions(const SimulationConfig &config);
    SchedulerOptions makeSchedulerOptions(const SimulationConfig &config);

    // Registers every configured actor in the store, spawns it in the world and
    // attaches a node to each camera-carrying vehicle and each RSU.
    bool buildScenario(const SimulationConfig &config,
                       KinematicWorld &world,
                       WorldStateStore &store,
                       TickScheduler &scheduler,
                       std::string *error = nullptr);
} // namespace edgesim
