#pragma once

#include "OutputSummary.hpp"
#include "SimulationConfig.hpp"
#include "TickScheduler.hpp"
#include "WorldStateStore.hpp"

#include <map>
#include <string>
#include <vector>

namespace edgesim
{
    struct ConfigParseResult
    {
        bool ok = false;
        SimulationConfig config{};
        std::vector<std::string> errors;
    };

    std::string simulationConfigToJson(const SimulationConfig &config);
    ConfigParseResult simulationConfigFromJson(const std::string &json_text);
    std::string validationErrorsToJson(const std::vector<std::string> &errors);

    std::string summaryToJson(const OutputSummary &summary);
    std::string summariesToJson(const std::map<std::string, OutputSummary> &summaries);
    std::string detectionsToJson(const std::vector<DetectionRecord> &records, std::size_t first_index);

    // Snapshot of the scenario and its counters for external persistence.
    std::string metadataToJson(const WorldStateStore &store, const SimulationConfig &config, const std::string &timestamp);
    std::string metricsToJson(const WorldStateStore &store, const SchedulerMetrics &metrics);
} // namespace edgesim
