#include <iostream>
#include <atomic>
#include <csignal>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>
#include <optional>
#include <vector>
#include "KinematicWorld.hpp"
#include "Scenario.hpp"
#include "SimulationJson.hpp"
#include "SummaryHttpServer.hpp"
#include "TickScheduler.hpp"
#include "db/Database.hpp"

namespace
{
    std::atomic<bool> g_keep_running{true};

    void handleSignal(int)
    {
        g_keep_running = false;
    }

    std::optional<edgesim::SimulationConfig> loadConfig(int argc, char **argv)
    {
        if (argc < 2)
        {
            std::cout << "No config given, using the built-in scenario" << std::endl;
            return edgesim::makeDefaultSimulationConfig();
        }

        std::ifstream in(argv[1]);
        if (!in)
        {
            std::cerr << "Error: cannot open config file " << argv[1] << std::endl;
            return std::nullopt;
        }
        std::ostringstream content;
        content << in.rdbuf();

        edgesim::ConfigParseResult parsed = edgesim::simulationConfigFromJson(content.str());
        if (!parsed.ok)
        {
            for (const auto &error : parsed.errors)
            {
                std::cerr << "Config error: " << error << std::endl;
            }
            return std::nullopt;
        }
        return parsed.config;
    }

    std::string currentTimestamp()
    {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        std::ostringstream out;
        out << std::put_time(&local, "%Y-%m-%d_%H-%M-%S");
        return out.str();
    }

    // Timestamp plus milliseconds; keys this run's rows in the database.
    std::string makeRunId(const std::string &timestamp)
    {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        const long long millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;
        std::ostringstream out;
        out << timestamp << "." << std::setw(3) << std::setfill('0') << millis;
        return out.str();
    }
}

int main(int argc, char **argv)
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "=== EdgeSim Multi-Agent Simulation ===" << std::endl;
    std::cout << std::endl;

    std::optional<edgesim::SimulationConfig> loaded = loadConfig(argc, argv);
    if (!loaded.has_value())
    {
        return 1;
    }
    const edgesim::SimulationConfig config = *loaded;
    const std::string timestamp = currentTimestamp();
    const std::string run_id = makeRunId(timestamp);

    edgesim::ReplayDetectionModel model;
    if (!config.detections_file.empty())
    {
        std::string error;
        if (!model.loadFromFile(config.detections_file, &error))
        {
            std::cerr << "Error: failed to load detections: " << error << std::endl;
            return 1;
        }
        std::cout << "Loaded " << model.getTableCount() << " detection tables from " << config.detections_file << std::endl;
    }

    edgesim::KinematicWorld world(edgesim::makeWorldOptions(config));
    edgesim::WorldStateStore store(config.fps);
    edgesim::TickScheduler scheduler(world, store, model, edgesim::makeSchedulerOptions(config));

    std::string scenario_error;
    if (!edgesim::buildScenario(config, world, store, scheduler, &scenario_error))
    {
        std::cerr << "Error: failed to build scenario: " << scenario_error << std::endl;
        return 1;
    }

    if (config.http_port == 0)
    {
        uint64_t remaining = config.n_frames;
        scheduler.start();
        while (remaining > 0 && g_keep_running && scheduler.runTick())
        {
            remaining--;
        }
        scheduler.pause();
    }
    else
    {
        std::mutex scheduler_mutex;
        std::atomic<bool> app_running{true};

        edgesim::SummaryHttpServer server(
            config.http_port,
            [&](const std::optional<std::string> &node_id) -> std::optional<std::string>
            {
                std::lock_guard<std::mutex> lock(scheduler_mutex);
                if (!node_id.has_value())
                {
                    return edgesim::summariesToJson(scheduler.snapshotSummaries());
                }
                std::optional<edgesim::OutputSummary> summary = scheduler.latestSummary(*node_id);
                if (!summary.has_value())
                {
                    return std::nullopt;
                }
                return edgesim::summaryToJson(*summary);
            },
            [&](std::size_t since)
            {
                std::lock_guard<std::mutex> lock(scheduler_mutex);
                return edgesim::detectionsToJson(scheduler.detectionsSince(since), since);
            },
            [&]()
            {
                std::lock_guard<std::mutex> lock(scheduler_mutex);
                return edgesim::metadataToJson(store, config, timestamp);
            },
            [&]()
            {
                std::lock_guard<std::mutex> lock(scheduler_mutex);
                return edgesim::metricsToJson(store, scheduler.getMetrics());
            },
            [&](const std::string &cmd)
            {
                std::lock_guard<std::mutex> lock(scheduler_mutex);
                if (cmd == "start")
                    scheduler.handleCommand(edgesim::TickScheduler::Command::Start);
                else if (cmd == "stop")
                    scheduler.handleCommand(edgesim::TickScheduler::Command::Pause);
                else if (cmd == "step")
                    scheduler.handleCommand(edgesim::TickScheduler::Command::Step);
                else
                    return false;
                return true;
            });

        if (!server.start())
        {
            std::cerr << "Failed to start HTTP server on port " << config.http_port << std::endl;
            return 1;
        }

        const auto frame_period = std::chrono::milliseconds(static_cast<int64_t>(1000.0 / config.fps));
        scheduler.start();
        std::thread sim_thread([&]()
                               {
            while (app_running)
            {
                {
                    std::lock_guard<std::mutex> lock(scheduler_mutex);
                    if (scheduler.getMetrics().ticks_run >= config.n_frames)
                    {
                        scheduler.pause();
                    }
                    else
                    {
                        scheduler.runTick();
                    }
                }
                std::this_thread::sleep_for(frame_period);
            } });

        std::cout << "Summaries at: http://localhost:" << config.http_port << "/summaries" << std::endl;
        std::cout << "Press Ctrl+C to stop..." << std::endl;

        while (g_keep_running)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        app_running = false;
        if (sim_thread.joinable())
        {
            sim_thread.join();
        }
        server.stop();
    }

    const edgesim::TeardownReport report = scheduler.teardown();
    std::cout << "Released " << report.released << " actors" << std::endl;
    for (const auto &failure : report.failures)
    {
        std::cerr << "Warning: teardown: " << failure << std::endl;
    }

    const edgesim::SchedulerMetrics metrics = scheduler.getMetrics();
    std::cout << "Ran " << metrics.ticks_run << " ticks, " << metrics.summaries_published << " summaries, "
              << metrics.detections_logged << " detections" << std::endl;
    for (const auto &entry : store.travelTimes())
    {
        std::cout << "Travel time " << entry.first << ": " << entry.second << " s" << std::endl;
    }
    for (const auto &intersection : store.getIntersections())
    {
        std::cout << "Congestion " << intersection.id << ": " << intersection.congestion_ticks
                  << "/" << intersection.sampled_ticks << " ticks" << std::endl;
    }

    if (!config.database_path.empty())
    {
        edgesim::db::Database database(config.database_path);
        std::string db_error;
        if (!database.initialize(&db_error))
        {
            std::cerr << "Warning: failed to initialize database: " << db_error << std::endl;
            return 1;
        }
        if (!database.saveMetadataJson(run_id, edgesim::metadataToJson(store, config, timestamp), &db_error))
        {
            std::cerr << "Warning: failed to save metadata: " << db_error << std::endl;
            return 1;
        }
        if (!database.appendDetections(run_id, scheduler.getDetectionLog().entries(), &db_error))
        {
            std::cerr << "Warning: failed to save detections: " << db_error << std::endl;
            return 1;
        }
        std::cout << "Saved run " << run_id << " to " << config.database_path << std::endl;
    }

    return 0;
}
