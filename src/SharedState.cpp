#include "SharedState.hpp"

#include <algorithm>
#include <utility>

namespace edgesim
{

    void LatestSummaryMap::publish(OutputSummary summary)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::string key = summary.node_id;
        entries[key] = std::move(summary);
    }

    std::optional<OutputSummary> LatestSummaryMap::get(const std::string &node_id) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = entries.find(node_id);
        if (it == entries.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<std::string, OutputSummary> LatestSummaryMap::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return std::map<std::string, OutputSummary>(entries.begin(), entries.end());
    }

    std::vector<std::string> LatestSummaryMap::staleNodes(uint64_t tick) const
    {
        std::vector<std::string> stale;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto &entry : entries)
            {
                if (entry.second.tick < tick)
                {
                    stale.push_back(entry.first);
                }
            }
        }
        std::sort(stale.begin(), stale.end());
        return stale;
    }

    std::size_t LatestSummaryMap::size() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return entries.size();
    }

    void DetectionLog::append(const std::vector<DetectionRecord> &batch)
    {
        if (batch.empty())
        {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex);
        records.insert(records.end(), batch.begin(), batch.end());
    }

    std::size_t DetectionLog::size() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return records.size();
    }

    std::vector<DetectionRecord> DetectionLog::entries(std::size_t from) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (from >= records.size())
        {
            return {};
        }
        return std::vector<DetectionRecord>(records.begin() + static_cast<std::ptrdiff_t>(from), records.end());
    }

} // namespace edgesim
