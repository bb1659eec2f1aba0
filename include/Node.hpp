#pragma once

#include "DataSource.hpp"
#include "DetectionModel.hpp"
#include "DetectionReducer.hpp"
#include "OutputSummary.hpp"
#include "SharedState.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace edgesim
{
    enum class NodePhase
    {
        Created,
        Reading,
        Inferring,
        Reducing,
        Publishing,
        Suspended,
        Stopped
    };

    enum class TickOutcome
    {
        Published,
        DataUnavailable,
        InferenceFailed,
        AlreadyPublished, // tick at or before the last published one
        Stopped
    };

    const char *toString(NodePhase phase);
    const char *toString(TickOutcome outcome);

    struct NodeStats
    {
        uint64_t published = 0;
        uint64_t data_unavailable = 0;
        uint64_t inference_failed = 0;
        uint64_t malformed_rows = 0;
        uint64_t last_published_tick = 0;
    };

    // One simulated agent. Each tick() runs one read/infer/reduce/publish pass
    // and leaves the node suspended until the next call.
    class Node
    {
    public:
        Node(std::string node_id,
             const IDataSource &data_source,
             IDetectionModel &model,
             const DetectionReducer &reducer,
             LatestSummaryMap &summaries,
             DetectionLog &detection_log);

        Node(const Node &) = delete;
        Node &operator=(const Node &) = delete;

        TickOutcome tick(uint64_t tick);
        void stop();

        const std::string &getId() const { return node_id; }
        NodePhase getPhase() const { return phase.load(); }
        bool isStopped() const { return phase.load() == NodePhase::Stopped; }
        NodeStats getStats() const;

    private:
        bool enterPhase(NodePhase next);
        TickOutcome failTick(TickOutcome outcome, uint64_t tick, const std::string &reason);

        std::string node_id;
        const IDataSource &data_source;
        IDetectionModel &model;
        const DetectionReducer &reducer;
        LatestSummaryMap &summaries;
        DetectionLog &detection_log;

        std::atomic<NodePhase> phase;
        mutable std::mutex stats_mutex;
        NodeStats stats;
    };

} // namespace edgesim
