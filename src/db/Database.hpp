#pragma once

#include "OutputSummary.hpp"

#include <optional>
#include <string>
#include <vector>

namespace edgesim::db
{

    class Database
    {
    public:
        explicit Database(std::string file_path);

        bool initialize(std::string *error = nullptr) const;

        // Every row is keyed by run_id, so runs sharing one file never mix.
        bool saveMetadataJson(const std::string &run_id, const std::string &metadata_json, std::string *error = nullptr) const;
        std::optional<std::string> loadMetadataJson(const std::string &run_id, std::string *error = nullptr) const;

        // All rows land in one transaction or none do.
        bool appendDetections(const std::string &run_id, const std::vector<DetectionRecord> &records, std::string *error = nullptr) const;
        std::optional<std::size_t> countDetections(const std::string &run_id, std::string *error = nullptr) const;

    private:
        std::string file_path;
    };

} // namespace edgesim::db
