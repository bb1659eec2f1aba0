#pragma once

#include "DataSource.hpp"
#include "DetectionModel.hpp"
#include "WorldSimulator.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace edgesim::test
{
    inline EntityState makeState(const std::string &id, double x, double y, double vx = 0.0, double vy = 0.0)
    {
        EntityState state;
        state.id = id;
        state.location = Vec3{x, y, 0.0};
        state.velocity = Vec3{vx, vy, 0.0};
        return state;
    }

    inline RawDetection makeRow(const std::string &label, double xmin, double ymin, double xmax, double ymax)
    {
        RawDetection row;
        row.class_label = label;
        row.confidence = 0.9;
        row.xmin = xmin;
        row.ymin = ymin;
        row.xmax = xmax;
        row.ymax = ymax;
        return row;
    }

    // Scripted world: poses, signals and cameras are set directly by the test.
    class FakeWorld : public IWorldSimulator
    {
    public:
        uint64_t tick = 0;
        uint32_t width = 640;
        uint32_t height = 480;
        std::map<std::string, EntityState> states;
        std::map<std::string, LightState> signals;
        std::set<std::string> cameras;
        std::set<std::string> fail_release;
        std::vector<std::string> released;

        uint64_t currentTick() const override { return tick; }

        std::optional<EntityState> entityPoseVelocity(const std::string &entity_id) const override
        {
            auto it = states.find(entity_id);
            if (it == states.end())
                return std::nullopt;
            EntityState state = it->second;
            state.tick = tick;
            return state;
        }

        std::optional<CameraFrame> cameraFrame(const std::string &sensor_id) const override
        {
            if (cameras.count(sensor_id) == 0)
                return std::nullopt;
            CameraFrame frame;
            frame.sensor_id = sensor_id;
            frame.tick = tick;
            frame.width = width;
            frame.height = height;
            return frame;
        }

        LightState trafficSignalState(const std::string &entity_id) const override
        {
            auto it = signals.find(entity_id);
            return it == signals.end() ? LightState::Green : it->second;
        }

        void advanceOneTick() override { tick++; }

        bool releaseActor(const std::string &actor_id, std::string *error = nullptr) override
        {
            if (fail_release.count(actor_id) > 0)
            {
                if (error)
                    *error = "actor busy";
                return false;
            }
            released.push_back(actor_id);
            return true;
        }
    };

    // Same table for every frame of a sensor; optionally throws or stalls.
    class ScriptedModel : public IDetectionModel
    {
    public:
        std::map<std::string, RawDetectionTable> tables;
        std::map<std::string, int> delay_ms;
        std::atomic<bool> fail{false};
        std::atomic<int> calls{0};

        RawDetectionTable infer(const CameraFrame &frame) override
        {
            calls++;
            if (fail)
                throw std::runtime_error("model crashed");
            auto delay = delay_ms.find(frame.sensor_id);
            if (delay != delay_ms.end())
                std::this_thread::sleep_for(std::chrono::milliseconds(delay->second));
            auto it = tables.find(frame.sensor_id);
            return it == tables.end() ? RawDetectionTable{} : it->second;
        }
    };

    class StubDataSource : public IDataSource
    {
    public:
        std::map<std::pair<std::string, uint64_t>, EntityState> states;
        std::map<std::pair<std::string, uint64_t>, CameraFrame> frames;

        void provide(const std::string &node_id, uint64_t tick, EntityState state, uint32_t width = 640, uint32_t height = 480)
        {
            state.tick = tick;
            states[{node_id, tick}] = state;
            CameraFrame frame;
            frame.sensor_id = "camera_" + node_id;
            frame.tick = tick;
            frame.width = width;
            frame.height = height;
            frames[{node_id, tick}] = frame;
        }

        std::optional<EntityState> readEntityState(const std::string &node_id, uint64_t tick) const override
        {
            auto it = states.find({node_id, tick});
            if (it == states.end())
                return std::nullopt;
            return it->second;
        }

        std::optional<CameraFrame> readImage(const std::string &node_id, uint64_t tick) const override
        {
            auto it = frames.find({node_id, tick});
            if (it == frames.end())
                return std::nullopt;
            return it->second;
        }
    };
} // namespace edgesim::test
