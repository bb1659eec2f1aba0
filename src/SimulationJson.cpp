#include "SimulationJson.hpp"

#include <nlohmann/json.hpp>

#include <exception>

namespace edgesim
{
    namespace
    {
        using nlohmann::json;

        json vec3ToJson(const Vec3 &v)
        {
            return json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
        }

        json rotationToJson(const Rotation &r)
        {
            return json{{"pitch", r.pitch}, {"yaw", r.yaw}, {"roll", r.roll}};
        }

        json dimensionsToJson(const Dimensions &d)
        {
            return json{{"length", d.length}, {"width", d.width}, {"height", d.height}};
        }

        json detectionToJson(const DetectionRecord &record)
        {
            json out;
            out["parent_id"] = record.parent_id;
            out["detection_id"] = record.detection_index;
            out["type"] = toString(record.type);
            out["xmin"] = record.xmin;
            out["ymin"] = record.ymin;
            out["xmax"] = record.xmax;
            out["ymax"] = record.ymax;
            out["tick"] = record.tick;
            return out;
        }

        json summaryToJsonObject(const OutputSummary &summary)
        {
            json out;
            out["node_id"] = summary.node_id;
            out["is_rsu"] = summary.is_rsu;
            out["x"] = summary.x;
            out["y"] = summary.y;
            out["heading"] = summary.heading;
            out["speed"] = summary.speed;
            out["tick"] = summary.tick;
            out["detections"] = json::array();
            for (const auto &record : summary.detections)
            {
                out["detections"].push_back(detectionToJson(record));
            }
            return out;
        }

        void readString(const json &obj, const char *key, std::string &out, std::vector<std::string> &errors, const std::string &context)
        {
            if (!obj.contains(key))
                return;
            if (!obj[key].is_string())
            {
                errors.push_back(context + key + " must be a string");
                return;
            }
            out = obj[key].get<std::string>();
        }

        void readBool(const json &obj, const char *key, bool &out, std::vector<std::string> &errors, const std::string &context)
        {
            if (!obj.contains(key))
                return;
            if (!obj[key].is_boolean())
            {
                errors.push_back(context + key + " must be a boolean");
                return;
            }
            out = obj[key].get<bool>();
        }

        void readNumber(const json &obj, const char *key, double &out, std::vector<std::string> &errors, const std::string &context)
        {
            if (!obj.contains(key))
                return;
            if (!obj[key].is_number())
            {
                errors.push_back(context + key + " must be a number");
                return;
            }
            out = obj[key].get<double>();
        }

        template <typename T>
        void readUnsigned(const json &obj, const char *key, T &out, std::vector<std::string> &errors, const std::string &context)
        {
            if (!obj.contains(key))
                return;
            if (!obj[key].is_number_unsigned())
            {
                errors.push_back(context + key + " must be a non-negative integer");
                return;
            }
            out = obj[key].get<T>();
        }

        bool readVec3(const json &value, Vec3 &out, std::vector<std::string> &errors, const std::string &context)
        {
            if (value.is_array() && (value.size() == 2 || value.size() == 3))
            {
                for (const auto &component : value)
                {
                    if (!component.is_number())
                    {
                        errors.push_back(context + " coordinates must be numbers");
                        return false;
                    }
                }
                out.x = value[0].get<double>();
                out.y = value[1].get<double>();
                out.z = value.size() == 3 ? value[2].get<double>() : 0.0;
                return true;
            }
            if (value.is_object())
            {
                if (!value.contains("x") || !value.contains("y"))
                {
                    errors.push_back(context + " needs x and y");
                    return false;
                }
                const std::size_t before = errors.size();
                readNumber(value, "x", out.x, errors, context + ".");
                readNumber(value, "y", out.y, errors, context + ".");
                readNumber(value, "z", out.z, errors, context + ".");
                return errors.size() == before;
            }
            errors.push_back(context + " must be an {x, y, z} object or a coordinate array");
            return false;
        }

        void readRotation(const json &value, Rotation &out, std::vector<std::string> &errors, const std::string &context)
        {
            if (!value.is_object())
            {
                errors.push_back(context + " must be an object");
                return;
            }
            readNumber(value, "pitch", out.pitch, errors, context + ".");
            readNumber(value, "yaw", out.yaw, errors, context + ".");
            readNumber(value, "roll", out.roll, errors, context + ".");
        }

        void readDimensions(const json &value, Dimensions &out, std::vector<std::string> &errors, const std::string &context)
        {
            if (!value.is_object())
            {
                errors.push_back(context + " must be an object");
                return;
            }
            readNumber(value, "length", out.length, errors, context + ".");
            readNumber(value, "width", out.width, errors, context + ".");
            readNumber(value, "height", out.height, errors, context + ".");
            if (out.length < 0.0 || out.width < 0.0 || out.height < 0.0)
            {
                errors.push_back(context + " must not be negative");
            }
        }

        bool classFromString(const std::string &value, DetectionClass &type)
        {
            if (value == "vehicle")
            {
                type = DetectionClass::Vehicle;
                return true;
            }
            if (value == "person")
            {
                type = DetectionClass::Person;
                return true;
            }
            return false;
        }

        void parseVehicle(const json &vehicle_json, std::size_t index, SimulationConfig &config, std::vector<std::string> &errors)
        {
            const std::string context = "vehicles[" + std::to_string(index) + "].";
            if (!vehicle_json.is_object())
            {
                errors.push_back("each vehicle entry must be an object");
                return;
            }

            VehicleConfig vehicle;
            readString(vehicle_json, "model", vehicle.model, errors, context);
            if (vehicle_json.contains("spawn_point"))
            {
                std::size_t spawn_point = 0;
                const std::size_t before = errors.size();
                readUnsigned(vehicle_json, "spawn_point", spawn_point, errors, context);
                if (errors.size() == before)
                {
                    vehicle.spawn_point = spawn_point;
                }
            }
            if (vehicle_json.contains("route"))
            {
                if (!vehicle_json["route"].is_array())
                {
                    errors.push_back(context + "route must be an array of spawn point indices");
                    return;
                }
                for (const auto &waypoint : vehicle_json["route"])
                {
                    if (!waypoint.is_number_unsigned())
                    {
                        errors.push_back(context + "route entries must be non-negative integers");
                        return;
                    }
                    vehicle.route.push_back(waypoint.get<std::size_t>());
                }
            }
            readNumber(vehicle_json, "speed", vehicle.cruise_speed, errors, context);
            if (vehicle.cruise_speed < 0.0)
            {
                errors.push_back(context + "speed must not be negative");
            }
            if (vehicle_json.contains("dimensions"))
            {
                readDimensions(vehicle_json["dimensions"], vehicle.dimensions, errors, context + "dimensions");
            }
            if (vehicle_json.contains("camera"))
            {
                const json &camera_json = vehicle_json["camera"];
                if (camera_json.is_null())
                {
                    vehicle.camera.reset();
                }
                else if (camera_json.is_object())
                {
                    CameraMountConfig mount;
                    if (camera_json.contains("x"))
                    {
                        readVec3(camera_json, mount.location, errors, context + "camera");
                    }
                    readRotation(camera_json, mount.rotation, errors, context + "camera");
                    vehicle.camera = mount;
                }
                else
                {
                    errors.push_back(context + "camera must be an object or null");
                }
            }

            if (!vehicle.spawn_point.has_value() && vehicle.route.empty())
            {
                errors.push_back(context + "needs a spawn_point or a route");
                return;
            }
            if (vehicle.spawn_point.has_value() && *vehicle.spawn_point >= config.spawn_points.size())
            {
                errors.push_back(context + "spawn_point is outside the spawn point list");
                return;
            }
            for (std::size_t waypoint : vehicle.route)
            {
                if (waypoint >= config.spawn_points.size())
                {
                    errors.push_back(context + "route references a missing spawn point");
                    return;
                }
            }

            config.vehicles.push_back(vehicle);
        }
    }

    std::string simulationConfigToJson(const SimulationConfig &config)
    {
        json root;
        root["map"] = config.map_name;
        root["img_width"] = config.img_width;
        root["img_height"] = config.img_height;
        root["n_frames"] = config.n_frames;
        root["fps"] = config.fps;
        root["speed_limit"] = config.speed_limit;
        root["intersection_radius"] = config.intersection_radius;
        root["self_detection"] = {{"ymin_divisor", config.reducer.self_zone.ymin_divisor},
                                  {"ymax_divisor", config.reducer.self_zone.ymax_divisor}};
        root["class_labels"] = json::object();
        for (const auto &label : config.reducer.class_labels)
        {
            root["class_labels"][label.first] = toString(label.second);
        }
        root["signal_cycle"] = {{"green_seconds", config.signal_timing.green_seconds},
                                {"orange_seconds", config.signal_timing.orange_seconds}};
        root["parallel_nodes"] = config.parallel_nodes;
        root["worker_threads"] = config.worker_threads;
        root["http_port"] = config.http_port;
        root["database"] = config.database_path;
        root["detections_file"] = config.detections_file;

        root["spawn_points"] = json::array();
        for (const auto &point : config.spawn_points)
        {
            root["spawn_points"].push_back(vec3ToJson(point));
        }

        root["vehicles"] = json::array();
        for (const auto &vehicle : config.vehicles)
        {
            json vehicle_json;
            vehicle_json["model"] = vehicle.model;
            if (vehicle.spawn_point.has_value())
            {
                vehicle_json["spawn_point"] = *vehicle.spawn_point;
            }
            vehicle_json["route"] = vehicle.route;
            vehicle_json["speed"] = vehicle.cruise_speed;
            vehicle_json["dimensions"] = dimensionsToJson(vehicle.dimensions);
            if (vehicle.camera.has_value())
            {
                json camera_json = vec3ToJson(vehicle.camera->location);
                camera_json.update(rotationToJson(vehicle.camera->rotation));
                vehicle_json["camera"] = camera_json;
            }
            else
            {
                vehicle_json["camera"] = nullptr;
            }
            root["vehicles"].push_back(vehicle_json);
        }

        root["rsus"] = json::array();
        for (const auto &rsu : config.rsus)
        {
            root["rsus"].push_back({{"location", vec3ToJson(rsu.location)},
                                    {"rotation", rotationToJson(rsu.rotation)},
                                    {"dimensions", dimensionsToJson(rsu.dimensions)}});
        }

        root["intersections"] = json::array();
        for (const auto &location : config.intersections)
        {
            root["intersections"].push_back(vec3ToJson(location));
        }

        root["pedestrians"] = json::array();
        for (const auto &pedestrian : config.pedestrians)
        {
            root["pedestrians"].push_back({{"location", vec3ToJson(pedestrian.location)},
                                           {"dimensions", dimensionsToJson(pedestrian.dimensions)}});
        }

        return root.dump();
    }

    ConfigParseResult simulationConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;
        std::vector<std::string> &errors = result.errors;
        SimulationConfig &config = result.config;

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            errors.push_back("root must be an object");
            return result;
        }

        readString(root, "map", config.map_name, errors, "");
        readUnsigned(root, "img_width", config.img_width, errors, "");
        readUnsigned(root, "img_height", config.img_height, errors, "");
        readUnsigned(root, "n_frames", config.n_frames, errors, "");
        readNumber(root, "fps", config.fps, errors, "");
        readNumber(root, "speed_limit", config.speed_limit, errors, "");
        readNumber(root, "intersection_radius", config.intersection_radius, errors, "");
        readBool(root, "parallel_nodes", config.parallel_nodes, errors, "");
        readUnsigned(root, "worker_threads", config.worker_threads, errors, "");
        readString(root, "database", config.database_path, errors, "");
        readString(root, "detections_file", config.detections_file, errors, "");

        if (root.contains("http_port"))
        {
            if (!root["http_port"].is_number_unsigned() || root["http_port"].get<uint64_t>() > 65535)
            {
                errors.push_back("http_port must be an integer in [0, 65535]");
            }
            else
            {
                config.http_port = root["http_port"].get<int>();
            }
        }

        if (config.img_width == 0 || config.img_height == 0)
            errors.push_back("img_width and img_height must be positive");
        if (config.fps <= 0.0)
            errors.push_back("fps must be positive");
        if (config.speed_limit <= 0.0)
            errors.push_back("speed_limit must be positive");
        if (config.intersection_radius <= 0.0)
            errors.push_back("intersection_radius must be positive");
        if (config.worker_threads == 0)
            errors.push_back("worker_threads must be at least 1");

        if (root.contains("self_detection"))
        {
            const json &zone = root["self_detection"];
            if (!zone.is_object())
            {
                errors.push_back("self_detection must be an object");
            }
            else
            {
                readNumber(zone, "ymin_divisor", config.reducer.self_zone.ymin_divisor, errors, "self_detection.");
                readNumber(zone, "ymax_divisor", config.reducer.self_zone.ymax_divisor, errors, "self_detection.");
                if (config.reducer.self_zone.ymin_divisor <= 0.0 || config.reducer.self_zone.ymax_divisor <= 0.0)
                {
                    errors.push_back("self_detection divisors must be positive");
                }
            }
        }

        if (root.contains("class_labels"))
        {
            const json &labels = root["class_labels"];
            if (!labels.is_object())
            {
                errors.push_back("class_labels must be an object");
            }
            else
            {
                config.reducer.class_labels.clear();
                for (auto it = labels.begin(); it != labels.end(); ++it)
                {
                    DetectionClass type{};
                    if (!it.value().is_string() || !classFromString(it.value().get<std::string>(), type))
                    {
                        errors.push_back("class_labels." + it.key() + " must be \"vehicle\" or \"person\"");
                        continue;
                    }
                    config.reducer.class_labels[it.key()] = type;
                }
            }
        }

        if (root.contains("signal_cycle"))
        {
            const json &cycle = root["signal_cycle"];
            if (!cycle.is_object())
            {
                errors.push_back("signal_cycle must be an object");
            }
            else
            {
                readNumber(cycle, "green_seconds", config.signal_timing.green_seconds, errors, "signal_cycle.");
                readNumber(cycle, "orange_seconds", config.signal_timing.orange_seconds, errors, "signal_cycle.");
                if (config.signal_timing.green_seconds <= 0.0 || config.signal_timing.orange_seconds < 0.0)
                {
                    errors.push_back("signal_cycle durations are out of range");
                }
            }
        }

        if (root.contains("spawn_points"))
        {
            if (!root["spawn_points"].is_array())
            {
                errors.push_back("spawn_points must be an array");
            }
            else
            {
                std::size_t index = 0;
                for (const auto &point_json : root["spawn_points"])
                {
                    Vec3 point;
                    if (readVec3(point_json, point, errors, "spawn_points[" + std::to_string(index) + "]"))
                    {
                        config.spawn_points.push_back(point);
                    }
                    index++;
                }
            }
        }

        if (root.contains("vehicles"))
        {
            if (!root["vehicles"].is_array())
            {
                errors.push_back("vehicles must be an array");
            }
            else
            {
                std::size_t index = 0;
                for (const auto &vehicle_json : root["vehicles"])
                {
                    parseVehicle(vehicle_json, index++, config, errors);
                }
            }
        }

        if (root.contains("rsus"))
        {
            if (!root["rsus"].is_array())
            {
                errors.push_back("rsus must be an array");
            }
            else
            {
                std::size_t index = 0;
                for (const auto &rsu_json : root["rsus"])
                {
                    const std::string context = "rsus[" + std::to_string(index++) + "]";
                    if (!rsu_json.is_object() || !rsu_json.contains("location"))
                    {
                        errors.push_back(context + " must be an object with a location");
                        continue;
                    }
                    RoadsideUnitConfig rsu;
                    if (!readVec3(rsu_json["location"], rsu.location, errors, context + ".location"))
                    {
                        continue;
                    }
                    if (rsu_json.contains("rotation"))
                        readRotation(rsu_json["rotation"], rsu.rotation, errors, context + ".rotation");
                    if (rsu_json.contains("dimensions"))
                        readDimensions(rsu_json["dimensions"], rsu.dimensions, errors, context + ".dimensions");
                    config.rsus.push_back(rsu);
                }
            }
        }

        if (root.contains("intersections"))
        {
            if (!root["intersections"].is_array())
            {
                errors.push_back("intersections must be an array");
            }
            else
            {
                std::size_t index = 0;
                for (const auto &location_json : root["intersections"])
                {
                    Vec3 location;
                    if (readVec3(location_json, location, errors, "intersections[" + std::to_string(index) + "]"))
                    {
                        config.intersections.push_back(location);
                    }
                    index++;
                }
            }
        }

        if (root.contains("pedestrians"))
        {
            if (!root["pedestrians"].is_array())
            {
                errors.push_back("pedestrians must be an array");
            }
            else
            {
                std::size_t index = 0;
                for (const auto &pedestrian_json : root["pedestrians"])
                {
                    const std::string context = "pedestrians[" + std::to_string(index++) + "]";
                    if (!pedestrian_json.is_object() || !pedestrian_json.contains("location"))
                    {
                        errors.push_back(context + " must be an object with a location");
                        continue;
                    }
                    PedestrianConfig pedestrian;
                    if (!readVec3(pedestrian_json["location"], pedestrian.location, errors, context + ".location"))
                    {
                        continue;
                    }
                    if (pedestrian_json.contains("dimensions"))
                        readDimensions(pedestrian_json["dimensions"], pedestrian.dimensions, errors, context + ".dimensions");
                    config.pedestrians.push_back(pedestrian);
                }
            }
        }

        result.ok = errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }

    std::string summaryToJson(const OutputSummary &summary)
    {
        return summaryToJsonObject(summary).dump();
    }

    std::string summariesToJson(const std::map<std::string, OutputSummary> &summaries)
    {
        json root = json::object();
        for (const auto &entry : summaries)
        {
            root[entry.first] = summaryToJsonObject(entry.second);
        }
        return root.dump();
    }

    std::string detectionsToJson(const std::vector<DetectionRecord> &records, std::size_t first_index)
    {
        json root;
        root["from"] = first_index;
        root["next"] = first_index + records.size();
        root["detections"] = json::array();
        for (const auto &record : records)
        {
            root["detections"].push_back(detectionToJson(record));
        }
        return root.dump();
    }

    std::string metadataToJson(const WorldStateStore &store, const SimulationConfig &config, const std::string &timestamp)
    {
        json root;
        root["timestamp"] = timestamp;
        root["map"] = config.map_name;
        root["waypoints"] = json::array();
        for (const auto &point : store.getSpawnPoints())
        {
            root["waypoints"].push_back(json::array({point.x, point.y}));
        }
        root["img_width"] = config.img_width;
        root["img_height"] = config.img_height;
        root["n_frames"] = config.n_frames;
        root["fps"] = store.getTicksPerSecond();
        root["n_vehicles"] = store.countEntities(EntityKind::Vehicle);
        root["n_rsus"] = store.countEntities(EntityKind::RoadsideUnit);
        root["n_sensors"] = store.getSensors().size();
        root["n_pedestrians"] = store.countEntities(EntityKind::Pedestrian);

        root["vehicles"] = json::array();
        root["rsus"] = json::array();
        root["pedestrians"] = json::array();
        for (const auto &entity : store.getEntities())
        {
            json entity_json;
            entity_json["id"] = entity.id;
            entity_json["width"] = entity.dimensions.width;
            entity_json["length"] = entity.dimensions.length;
            entity_json["height"] = entity.dimensions.height;
            switch (entity.kind)
            {
            case EntityKind::Vehicle:
                entity_json["model"] = entity.model;
                root["vehicles"].push_back(entity_json);
                break;
            case EntityKind::RoadsideUnit:
                entity_json["location"] = vec3ToJson(entity.state.location);
                root["rsus"].push_back(entity_json);
                break;
            case EntityKind::Pedestrian:
                root["pedestrians"].push_back(entity_json);
                break;
            }
        }

        root["sensors"] = json::array();
        for (const auto &sensor : store.getSensors())
        {
            json sensor_json;
            sensor_json["id"] = sensor.id;
            if (sensor.isFixed())
            {
                sensor_json["parent_id"] = nullptr;
                sensor_json["location"] = vec3ToJson(sensor.location);
                sensor_json["rotation"] = rotationToJson(sensor.rotation);
            }
            else
            {
                sensor_json["parent_id"] = *sensor.parent_id;
            }
            root["sensors"].push_back(sensor_json);
        }

        root["intersections"] = json::array();
        root["congestion_statistics"] = json::object();
        for (const auto &intersection : store.getIntersections())
        {
            root["intersections"].push_back({{"id", intersection.id},
                                             {"location", {{"x", intersection.location.x}, {"y", intersection.location.y}}}});
            root["congestion_statistics"][intersection.id] = intersection.congestion_ticks;
        }

        root["travel_times"] = json::object();
        for (const auto &entry : store.travelTimes())
        {
            root["travel_times"][entry.first] = entry.second;
        }

        return root.dump();
    }

    std::string metricsToJson(const WorldStateStore &store, const SchedulerMetrics &metrics)
    {
        json root;
        root["ticks_run"] = metrics.ticks_run;
        root["last_tick"] = metrics.last_tick;
        root["summaries_published"] = metrics.summaries_published;
        root["node_ticks_failed"] = metrics.node_ticks_failed;
        root["detections_logged"] = metrics.detections_logged;

        root["travel_times"] = json::object();
        for (const auto &entry : store.travelTimes())
        {
            root["travel_times"][entry.first] = entry.second;
        }

        root["congestion"] = json::object();
        for (const auto &intersection : store.getIntersections())
        {
            root["congestion"][intersection.id] = {{"congested_ticks", intersection.congestion_ticks},
                                                   {"sampled_ticks", intersection.sampled_ticks},
                                                   {"ratio", intersection.congestionRatio()}};
        }

        root["arrived"] = json::array();
        for (const auto &entity : store.getEntities())
        {
            if (entity.reached_destination)
            {
                root["arrived"].push_back(entity.id);
            }
        }
        return root.dump();
    }
} // namespace edgesim
