#include "DetectionModel.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace edgesim
{
    namespace
    {
        using nlohmann::json;

        std::optional<double> optionalNumber(const json &row, const char *key)
        {
            if (!row.contains(key) || !row[key].is_number())
            {
                return std::nullopt;
            }
            return row[key].get<double>();
        }

        RawDetection rawDetectionFromJson(const json &row)
        {
            RawDetection detection;
            if (!row.is_object())
            {
                return detection;
            }

            // "name" is the column label pandas-style model exports use.
            if (row.contains("name") && row["name"].is_string())
            {
                detection.class_label = row["name"].get<std::string>();
            }
            else if (row.contains("class_label") && row["class_label"].is_string())
            {
                detection.class_label = row["class_label"].get<std::string>();
            }

            detection.confidence = optionalNumber(row, "confidence");
            detection.xmin = optionalNumber(row, "xmin");
            detection.ymin = optionalNumber(row, "ymin");
            detection.xmax = optionalNumber(row, "xmax");
            detection.ymax = optionalNumber(row, "ymax");
            return detection;
        }
    }

    bool ReplayDetectionModel::loadFromJson(const std::string &json_text, std::string *error)
    {
        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            if (error)
                *error = std::string("invalid JSON: ") + e.what();
            return false;
        }

        if (!root.is_object())
        {
            if (error)
                *error = "detections root must be an object keyed by camera id";
            return false;
        }

        for (auto camera_it = root.begin(); camera_it != root.end(); ++camera_it)
        {
            if (!camera_it.value().is_object())
            {
                if (error)
                    *error = "detections for " + camera_it.key() + " must be an object keyed by tick";
                return false;
            }

            for (auto tick_it = camera_it.value().begin(); tick_it != camera_it.value().end(); ++tick_it)
            {
                uint64_t tick = 0;
                try
                {
                    tick = std::stoull(tick_it.key());
                }
                catch (const std::exception &)
                {
                    if (error)
                        *error = "tick key is not a number: " + tick_it.key();
                    return false;
                }

                if (!tick_it.value().is_array())
                {
                    if (error)
                        *error = "detection table for " + camera_it.key() + "@" + tick_it.key() + " must be an array";
                    return false;
                }

                RawDetectionTable table;
                for (const auto &row : tick_it.value())
                {
                    table.push_back(rawDetectionFromJson(row));
                }
                setTable(camera_it.key(), tick, std::move(table));
            }
        }
        return true;
    }

    bool ReplayDetectionModel::loadFromFile(const std::string &path, std::string *error)
    {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
        {
            if (error)
                *error = "cannot open detections file: " + path;
            return false;
        }
        std::ostringstream content;
        content << in.rdbuf();
        return loadFromJson(content.str(), error);
    }

    void ReplayDetectionModel::setTable(const std::string &sensor_id, uint64_t tick, RawDetectionTable table)
    {
        tables[{sensor_id, tick}] = std::move(table);
    }

    RawDetectionTable ReplayDetectionModel::infer(const CameraFrame &frame)
    {
        auto it = tables.find({frame.sensor_id, frame.tick});
        if (it == tables.end())
        {
            return {};
        }
        return it->second;
    }

} // namespace edgesim
