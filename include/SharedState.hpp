#pragma once

#include "OutputSummary.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgesim
{
    // Latest published summary per node. Each node writes only its own key.
    class LatestSummaryMap
    {
    public:
        void publish(OutputSummary summary);

        std::optional<OutputSummary> get(const std::string &node_id) const;
        std::map<std::string, OutputSummary> snapshot() const;

        // Nodes whose latest entry is older than the given tick.
        std::vector<std::string> staleNodes(uint64_t tick) const;
        std::size_t size() const;

    private:
        mutable std::mutex mutex;
        std::unordered_map<std::string, OutputSummary> entries;
    };

    // Append-only record of every published detection.
    class DetectionLog
    {
    public:
        // The whole batch lands contiguously.
        void append(const std::vector<DetectionRecord> &batch);

        std::size_t size() const;
        std::vector<DetectionRecord> entries(std::size_t from = 0) const;

    private:
        mutable std::mutex mutex;
        std::vector<DetectionRecord> records;
    };

} // namespace edgesim
