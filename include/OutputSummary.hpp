#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace edgesim
{
    enum class DetectionClass : uint8_t
    {
        Vehicle = 0,
        Person = 1
    };

    inline const char *toString(DetectionClass type)
    {
        switch (type)
        {
        case DetectionClass::Vehicle:
            return "vehicle";
        case DetectionClass::Person:
            return "person";
        }
        return "vehicle";
    }

    struct DetectionRecord
    {
        std::string parent_id;
        uint32_t detection_index = 0; // row index in the raw detection table
        DetectionClass type = DetectionClass::Vehicle;
        double xmin = 0.0;
        double ymin = 0.0;
        double xmax = 0.0;
        double ymax = 0.0;
        uint64_t tick = 0;
    };

    // What one node publishes for one tick.
    struct OutputSummary
    {
        std::string node_id;
        bool is_rsu = false;
        double x = 0.0;
        double y = 0.0;
        double heading = 0.0; // degrees
        double speed = 0.0;   // m/s, planar
        uint64_t tick = 0;
        std::vector<DetectionRecord> detections;
    };

} // namespace edgesim
