#pragma once

#include "WorldSimulator.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace edgesim
{
    // One row of a perception model's output. Any field may be missing when
    // the model emits an incomplete row.
    struct RawDetection
    {
        std::optional<std::string> class_label;
        std::optional<double> confidence;
        std::optional<double> xmin;
        std::optional<double> ymin;
        std::optional<double> xmax;
        std::optional<double> ymax;
    };

    using RawDetectionTable = std::vector<RawDetection>;

    // Perception model. May be called from several node threads at once.
    class IDetectionModel
    {
    public:
        virtual ~IDetectionModel() = default;
        virtual RawDetectionTable infer(const CameraFrame &frame) = 0;
    };

    // Serves pre-recorded detection tables keyed by camera and tick.
    // File layout: {"camera_1": {"0": [{"name": "car", "confidence": 0.9,
    //               "xmin": 1, "ymin": 2, "xmax": 3, "ymax": 4}, ...]}}
    class ReplayDetectionModel : public IDetectionModel
    {
    public:
        ReplayDetectionModel() = default;

        bool loadFromJson(const std::string &json_text, std::string *error = nullptr);
        bool loadFromFile(const std::string &path, std::string *error = nullptr);
        void setTable(const std::string &sensor_id, uint64_t tick, RawDetectionTable table);

        RawDetectionTable infer(const CameraFrame &frame) override;

        std::size_t getTableCount() const { return tables.size(); }

    private:
        std::map<std::pair<std::string, uint64_t>, RawDetectionTable> tables;
    };

} // namespace edgesim
