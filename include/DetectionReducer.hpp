#pragma once

#include "DetectionModel.hpp"
#include "Entity.hpp"
#include "OutputSummary.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace edgesim
{
    // A mobile camera sees part of its own vehicle at the bottom of the frame.
    // Vehicle boxes with ymin > height / ymin_divisor and ymax > height / ymax_divisor
    // are treated as that self-detection. Thresholds are tuned for a roof mount.
    struct SelfDetectionZone
    {
        double ymin_divisor = 1.6;
        double ymax_divisor = 16.0;
    };

    inline std::unordered_map<std::string, DetectionClass> defaultClassLabels()
    {
        return {
            {"vehicle", DetectionClass::Vehicle},
            {"car", DetectionClass::Vehicle},
            {"person", DetectionClass::Person}};
    }

    struct ReducerConfig
    {
        SelfDetectionZone self_zone;
        std::unordered_map<std::string, DetectionClass> class_labels = defaultClassLabels();
    };

    struct ReduceResult
    {
        std::vector<DetectionRecord> detections;
        std::size_t dropped_by_class = 0;
        std::size_t dropped_as_self = 0;
        std::size_t dropped_malformed = 0;
        std::vector<std::string> errors; // one entry per malformed row
    };

    class DetectionReducer
    {
    public:
        explicit DetectionReducer(ReducerConfig config = ReducerConfig{});

        ReduceResult reduce(const RawDetectionTable &table,
                            uint32_t image_width,
                            uint32_t image_height,
                            const EntityState &owner,
                            const std::string &node_id,
                            uint64_t tick) const;

        bool isSelfDetection(double ymin, double ymax, uint32_t image_height) const;

        const ReducerConfig &getConfig() const { return config; }

    private:
        bool validateRow(const RawDetection &row, std::string &error) const;

        ReducerConfig config;
    };

} // namespace edgesim
