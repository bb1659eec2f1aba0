#include "Node.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace edgesim
{

    const char *toString(NodePhase phase)
    {
        switch (phase)
        {
        case NodePhase::Created:
            return "created";
        case NodePhase::Reading:
            return "reading";
        case NodePhase::Inferring:
            return "inferring";
        case NodePhase::Reducing:
            return "reducing";
        case NodePhase::Publishing:
            return "publishing";
        case NodePhase::Suspended:
            return "suspended";
        case NodePhase::Stopped:
            return "stopped";
        }
        return "created";
    }

    const char *toString(TickOutcome outcome)
    {
        switch (outcome)
        {
        case TickOutcome::Published:
            return "published";
        case TickOutcome::DataUnavailable:
            return "data_unavailable";
        case TickOutcome::InferenceFailed:
            return "inference_failed";
        case TickOutcome::AlreadyPublished:
            return "already_published";
        case TickOutcome::Stopped:
            return "stopped";
        }
        return "stopped";
    }

    Node::Node(std::string node_id,
               const IDataSource &data_source,
               IDetectionModel &model,
               const DetectionReducer &reducer,
               LatestSummaryMap &summaries,
               DetectionLog &detection_log)
        : node_id(std::move(node_id)),
          data_source(data_source),
          model(model),
          reducer(reducer),
          summaries(summaries),
          detection_log(detection_log),
          phase(NodePhase::Created)
    {
    }

    bool Node::enterPhase(NodePhase next)
    {
        NodePhase current = phase.load();
        while (current != NodePhase::Stopped)
        {
            if (phase.compare_exchange_weak(current, next))
            {
                return true;
            }
        }
        return false;
    }

    void Node::stop()
    {
        phase.store(NodePhase::Stopped);
    }

    NodeStats Node::getStats() const
    {
        std::lock_guard<std::mutex> lock(stats_mutex);
        return stats;
    }

    TickOutcome Node::failTick(TickOutcome outcome, uint64_t tick, const std::string &reason)
    {
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            if (outcome == TickOutcome::DataUnavailable)
                stats.data_unavailable++;
            else if (outcome == TickOutcome::InferenceFailed)
                stats.inference_failed++;
        }
        std::cerr << "Node " << node_id << ": tick " << tick << " skipped (" << reason << ")\n";

        // The next tick starts from a clean read.
        if (!enterPhase(NodePhase::Suspended))
        {
            return TickOutcome::Stopped;
        }
        return outcome;
    }

    TickOutcome Node::tick(uint64_t tick)
    {
        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            if (stats.published > 0 && tick <= stats.last_published_tick)
            {
                std::cerr << "Node " << node_id << ": tick " << tick << " ignored, already published tick "
                          << stats.last_published_tick << "\n";
                return TickOutcome::AlreadyPublished;
            }
        }

        if (!enterPhase(NodePhase::Reading))
        {
            return TickOutcome::Stopped;
        }

        std::optional<EntityState> state = data_source.readEntityState(node_id, tick);
        if (!state.has_value())
        {
            return failTick(TickOutcome::DataUnavailable, tick, "no entity state");
        }
        std::optional<CameraFrame> frame = data_source.readImage(node_id, tick);
        if (!frame.has_value())
        {
            return failTick(TickOutcome::DataUnavailable, tick, "no camera frame");
        }

        if (!enterPhase(NodePhase::Inferring))
        {
            return TickOutcome::Stopped;
        }
        RawDetectionTable raw;
        try
        {
            raw = model.infer(*frame);
        }
        catch (const std::exception &e)
        {
            return failTick(TickOutcome::InferenceFailed, tick, e.what());
        }

        if (!enterPhase(NodePhase::Reducing))
        {
            return TickOutcome::Stopped;
        }
        ReduceResult reduced = reducer.reduce(raw, frame->width, frame->height, *state, node_id, tick);
        for (const auto &error : reduced.errors)
        {
            std::cerr << "Node " << node_id << ": tick " << tick << " dropped malformed detection, " << error << "\n";
        }

        if (!enterPhase(NodePhase::Publishing))
        {
            return TickOutcome::Stopped;
        }

        OutputSummary summary;
        summary.node_id = node_id;
        summary.is_rsu = state->is_rsu;
        summary.x = state->location.x;
        summary.y = state->location.y;
        summary.heading = state->heading;
        summary.speed = state->planarSpeed();
        summary.tick = tick;
        summary.detections = reduced.detections;

        detection_log.append(reduced.detections);
        summaries.publish(std::move(summary));

        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            stats.published++;
            stats.malformed_rows += reduced.dropped_malformed;
            stats.last_published_tick = tick;
        }

        // A stop() that lands during publishing keeps the node stopped; both writes above are complete.
        enterPhase(NodePhase::Suspended);
        return TickOutcome::Published;
    }

} // namespace edgesim
