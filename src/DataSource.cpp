#include "DataSource.hpp"

namespace edgesim
{

    SimulatorDataSource::SimulatorDataSource(const WorldStateStore &store, const IWorldSimulator &simulator)
        : store(store), simulator(simulator)
    {
    }

    void SimulatorDataSource::bindCamera(const std::string &node_id, const std::string &sensor_id)
    {
        node_cameras[node_id] = sensor_id;
    }

    std::optional<std::string> SimulatorDataSource::cameraFor(const std::string &node_id) const
    {
        auto it = node_cameras.find(node_id);
        if (it == node_cameras.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<EntityState> SimulatorDataSource::readEntityState(const std::string &node_id, uint64_t tick) const
    {
        const Entity *entity = store.findEntity(node_id);
        if (!entity || !entity->has_state || entity->state.tick != tick)
        {
            return std::nullopt;
        }
        return entity->state;
    }

    std::optional<CameraFrame> SimulatorDataSource::readImage(const std::string &node_id, uint64_t tick) const
    {
        std::optional<std::string> sensor_id = cameraFor(node_id);
        if (!sensor_id.has_value())
        {
            return std::nullopt;
        }

        std::optional<CameraFrame> frame = simulator.cameraFrame(*sensor_id);
        if (!frame.has_value() || frame->tick != tick)
        {
            return std::nullopt;
        }
        return frame;
    }

} // namespace edgesim
