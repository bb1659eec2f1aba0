#include "DetectionReducer.hpp"

#include <cmath>
#include <utility>

namespace edgesim
{

    DetectionReducer::DetectionReducer(ReducerConfig config)
        : config(std::move(config))
    {
    }

    bool DetectionReducer::isSelfDetection(double ymin, double ymax, uint32_t image_height) const
    {
        const double height = static_cast<double>(image_height);
        const double ymin_limit = height / config.self_zone.ymin_divisor;
        const double ymax_limit = height / config.self_zone.ymax_divisor;
        return ymin > ymin_limit && ymax > ymax_limit;
    }

    bool DetectionReducer::validateRow(const RawDetection &row, std::string &error) const
    {
        if (!row.xmin || !row.ymin || !row.xmax || !row.ymax)
        {
            error = "missing bounding box coordinate";
            return false;
        }
        if (!std::isfinite(*row.xmin) || !std::isfinite(*row.ymin) ||
            !std::isfinite(*row.xmax) || !std::isfinite(*row.ymax))
        {
            error = "non-finite bounding box coordinate";
            return false;
        }
        if (*row.xmin > *row.xmax || *row.ymin > *row.ymax)
        {
            error = "inverted bounding box";
            return false;
        }
        return true;
    }

    ReduceResult DetectionReducer::reduce(const RawDetectionTable &table,
                                          uint32_t /*image_width*/,
                                          uint32_t image_height,
                                          const EntityState &owner,
                                          const std::string &node_id,
                                          uint64_t tick) const
    {
        ReduceResult result;
        for (std::size_t i = 0; i < table.size(); ++i)
        {
            const RawDetection &row = table[i];

            if (!row.class_label.has_value())
            {
                result.dropped_malformed++;
                result.errors.push_back("row " + std::to_string(i) + ": missing class label");
                continue;
            }

            auto class_it = config.class_labels.find(*row.class_label);
            if (class_it == config.class_labels.end())
            {
                result.dropped_by_class++;
                continue;
            }

            std::string error;
            if (!validateRow(row, error))
            {
                result.dropped_malformed++;
                result.errors.push_back("row " + std::to_string(i) + ": " + error);
                continue;
            }

            const DetectionClass type = class_it->second;
            if (!owner.is_rsu && type == DetectionClass::Vehicle &&
                isSelfDetection(*row.ymin, *row.ymax, image_height))
            {
                result.dropped_as_self++;
                continue;
            }

            DetectionRecord record;
            record.parent_id = node_id;
            record.detection_index = static_cast<uint32_t>(i);
            record.type = type;
            record.xmin = *row.xmin;
            record.ymin = *row.ymin;
            record.xmax = *row.xmax;
            record.ymax = *row.ymax;
            record.tick = tick;
            result.detections.push_back(record);
        }
        return result;
    }

} // namespace edgesim
