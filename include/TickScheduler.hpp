#pragma once

#include "DataSource.hpp"
#include "DetectionModel.hpp"
#include "DetectionReducer.hpp"
#include "Node.hpp"
#include "SharedState.hpp"
#include "TrafficAnalytics.hpp"
#include "WorldSimulator.hpp"
#include "WorldStateStore.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace edgesim
{
    struct SchedulerOptions
    {
        ReducerConfig reducer;
        double speed_limit = TrafficAnalytics::DEFAULT_SPEED_LIMIT;
        double intersection_radius = TrafficAnalytics::DEFAULT_RADIUS;
        bool parallel_nodes = false;
        std::size_t worker_threads = 4;
    };

    struct SchedulerMetrics
    {
        uint64_t ticks_run = 0;
        uint64_t last_tick = 0;
        uint64_t summaries_published = 0;
        uint64_t node_ticks_failed = 0;
        std::size_t detections_logged = 0;
        std::size_t congested_samples = 0;
    };

    struct TeardownReport
    {
        std::size_t released = 0;
        std::vector<std::string> failures;

        bool ok() const { return failures.empty(); }
    };

    // Global clock. Each tick: refresh world state, run every node, wait for
    // all of them (barrier), sample traffic analytics, advance the simulator.
    class TickScheduler
    {
    public:
        enum class Command
        {
            Start,
            Pause,
            Step
        };

        TickScheduler(IWorldSimulator &simulator,
                      WorldStateStore &store,
                      IDetectionModel &model,
                      SchedulerOptions options = SchedulerOptions{});
        ~TickScheduler();

        TickScheduler(const TickScheduler &) = delete;
        TickScheduler &operator=(const TickScheduler &) = delete;

        Node &addNode(const std::string &node_id, const std::string &sensor_id);

        // One full tick. Does nothing while paused or after cancel().
        bool runTick();
        // Runs up to n_ticks; returns how many actually ran.
        uint64_t run(uint64_t n_ticks);

        void start();
        void pause();
        bool isRunning() const;
        void handleCommand(Command command);

        // Stops every node; safe from another thread.
        void cancel();
        bool isCancelled() const { return cancelled.load(); }

        // Releases every sensor, then every entity. Keeps going past failures.
        TeardownReport teardown();

        // Tick-consistent reads: they wait for a running tick to finish, so
        // every entry comes from the same completed tick.
        std::map<std::string, OutputSummary> snapshotSummaries() const;
        std::optional<OutputSummary> latestSummary(const std::string &node_id) const;
        std::vector<DetectionRecord> detectionsSince(std::size_t from) const;

        const LatestSummaryMap &getSummaries() const { return summaries; }
        const DetectionLog &getDetectionLog() const { return detection_log; }
        const WorldStateStore &getStore() const { return store; }
        const TrafficAnalytics &getAnalytics() const { return analytics; }
        SchedulerMetrics getMetrics() const;
        std::size_t getNodeCount() const { return nodes.size(); }
        const Node *findNode(const std::string &node_id) const;

    private:
        void runNodes(uint64_t tick);
        void recordOutcome(TickOutcome outcome);

        IWorldSimulator &simulator;
        WorldStateStore &store;
        IDetectionModel &model;
        SchedulerOptions options;

        DetectionReducer reducer;
        TrafficAnalytics analytics;
        SimulatorDataSource data_source;
        LatestSummaryMap summaries;
        DetectionLog detection_log;
        std::vector<std::unique_ptr<Node>> nodes;

        mutable std::mutex tick_mutex; // held for the whole of runTick()
        std::atomic<bool> running{false};
        std::atomic<bool> cancelled{false};
        bool torn_down = false;

        std::atomic<uint64_t> summaries_published{0};
        std::atomic<uint64_t> node_ticks_failed{0};
        uint64_t ticks_run = 0;
        uint64_t last_tick = 0;
        std::size_t congested_samples = 0;
    };

} // namespace edgesim
