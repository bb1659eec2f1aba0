#pragma once

#include "Entity.hpp"
#include "WorldSimulator.hpp"
#include "WorldStateStore.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace edgesim
{
    // Per-node reads, keyed by (node id, tick). A read for a tick the source
    // does not hold returns nothing rather than older data.
    class IDataSource
    {
    public:
        virtual ~IDataSource() = default;
        virtual std::optional<EntityState> readEntityState(const std::string &node_id, uint64_t tick) const = 0;
        virtual std::optional<CameraFrame> readImage(const std::string &node_id, uint64_t tick) const = 0;
    };

    // Entity state from the world state store, frames straight from the simulator.
    class SimulatorDataSource : public IDataSource
    {
    public:
        SimulatorDataSource(const WorldStateStore &store, const IWorldSimulator &simulator);

        void bindCamera(const std::string &node_id, const std::string &sensor_id);
        std::optional<std::string> cameraFor(const std::string &node_id) const;

        std::optional<EntityState> readEntityState(const std::string &node_id, uint64_t tick) const override;
        std::optional<CameraFrame> readImage(const std::string &node_id, uint64_t tick) const override;

    private:
        const WorldStateStore &store;
        const IWorldSimulator &simulator;
        std::unordered_map<std::string, std::string> node_cameras;
    };

} // namespace edgesim
