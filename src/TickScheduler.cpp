#include "TickScheduler.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace edgesim
{

    TickScheduler::TickScheduler(IWorldSimulator &simulator,
                                 WorldStateStore &store,
                                 IDetectionModel &model,
                                 SchedulerOptions options)
        : simulator(simulator),
          store(store),
          model(model),
          options(std::move(options)),
          reducer(this->options.reducer),
          analytics(simulator, this->options.intersection_radius),
          data_source(store, simulator)
    {
    }

    TickScheduler::~TickScheduler()
    {
        if (!torn_down)
        {
            teardown();
        }
    }

    Node &TickScheduler::addNode(const std::string &node_id, const std::string &sensor_id)
    {
        data_source.bindCamera(node_id, sensor_id);
        nodes.push_back(std::make_unique<Node>(node_id, data_source, model, reducer, summaries, detection_log));
        return *nodes.back();
    }

    void TickScheduler::recordOutcome(TickOutcome outcome)
    {
        switch (outcome)
        {
        case TickOutcome::Published:
            summaries_published++;
            break;
        case TickOutcome::DataUnavailable:
        case TickOutcome::InferenceFailed:
            node_ticks_failed++;
            break;
        case TickOutcome::AlreadyPublished:
        case TickOutcome::Stopped:
            break;
        }
    }

    void TickScheduler::runNodes(uint64_t tick)
    {
        const std::size_t worker_count = std::min(options.worker_threads, nodes.size());
        if (!options.parallel_nodes || worker_count <= 1)
        {
            for (auto &node : nodes)
            {
                recordOutcome(node->tick(tick));
            }
            return;
        }

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t w = 0; w < worker_count; ++w)
        {
            workers.emplace_back([this, w, worker_count, tick]()
                                 {
                for (std::size_t i = w; i < nodes.size(); i += worker_count)
                {
                    recordOutcome(nodes[i]->tick(tick));
                } });
        }

        // Barrier: nothing reads tick state until every node has published.
        for (auto &worker : workers)
        {
            worker.join();
        }
    }

    bool TickScheduler::runTick()
    {
        if (!running || cancelled)
        {
            return false;
        }

        std::lock_guard<std::mutex> lock(tick_mutex);
        const uint64_t tick = simulator.currentTick();

        std::vector<std::string> missing = store.updateFromSimulator(simulator);
        for (const auto &entity_id : missing)
        {
            std::cerr << "Scheduler: no pose for " << entity_id << " at tick " << tick << "\n";
        }

        runNodes(tick);

        congested_samples += analytics.updateCongestion(store, options.speed_limit);
        store.advanceTravelAccounting();

        simulator.advanceOneTick();
        ticks_run++;
        last_tick = tick;
        return true;
    }

    uint64_t TickScheduler::run(uint64_t n_ticks)
    {
        start();
        uint64_t executed = 0;
        while (executed < n_ticks && runTick())
        {
            executed++;
        }
        pause();
        return executed;
    }

    void TickScheduler::start()
    {
        if (!cancelled)
        {
            running = true;
        }
    }

    void TickScheduler::pause()
    {
        running = false;
    }

    bool TickScheduler::isRunning() const
    {
        return running;
    }

    void TickScheduler::handleCommand(Command command)
    {
        switch (command)
        {
        case Command::Start:
            start();
            break;
        case Command::Pause:
            pause();
            break;
        case Command::Step:
            if (!running)
            {
                start();
                runTick();
                pause();
            }
            else
            {
                runTick();
            }
            break;
        }
    }

    void TickScheduler::cancel()
    {
        cancelled = true;
        running = false;
        for (auto &node : nodes)
        {
            node->stop();
        }
    }

    TeardownReport TickScheduler::teardown()
    {
        TeardownReport report;
        if (torn_down)
        {
            return report;
        }
        cancel();

        auto release = [&](const std::string &actor_id)
        {
            std::string error;
            if (simulator.releaseActor(actor_id, &error))
            {
                report.released++;
                return;
            }
            report.failures.push_back(actor_id + ": " + error);
            std::cerr << "Scheduler: failed to release " << actor_id << ": " << error << "\n";
        };

        // Sensors first so no camera outlives its parent.
        for (const auto &sensor : store.getSensors())
        {
            release(sensor.id);
        }
        for (const auto &entity : store.getEntities())
        {
            release(entity.id);
        }

        torn_down = true;
        return report;
    }

    std::map<std::string, OutputSummary> TickScheduler::snapshotSummaries() const
    {
        std::lock_guard<std::mutex> lock(tick_mutex);
        return summaries.snapshot();
    }

    std::optional<OutputSummary> TickScheduler::latestSummary(const std::string &node_id) const
    {
        std::lock_guard<std::mutex> lock(tick_mutex);
        return summaries.get(node_id);
    }

    std::vector<DetectionRecord> TickScheduler::detectionsSince(std::size_t from) const
    {
        std::lock_guard<std::mutex> lock(tick_mutex);
        return detection_log.entries(from);
    }

    SchedulerMetrics TickScheduler::getMetrics() const
    {
        std::lock_guard<std::mutex> lock(tick_mutex);
        SchedulerMetrics metrics;
        metrics.ticks_run = ticks_run;
        metrics.last_tick = last_tick;
        metrics.summaries_published = summaries_published;
        metrics.node_ticks_failed = node_ticks_failed;
        metrics.detections_logged = detection_log.size();
        metrics.congested_samples = congested_samples;
        return metrics;
    }

    const Node *TickScheduler::findNode(const std::string &node_id) const
    {
        for (const auto &node : nodes)
        {
            if (node->getId() == node_id)
                return node.get();
        }
        return nullptr;
    }

} // namespace edgesim
