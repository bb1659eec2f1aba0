#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "SimulationJson.hpp"
#include "TestWorld.hpp"

using namespace edgesim;
using nlohmann::json;

TEST_CASE("Empty config takes every default", "config")
{
    ConfigParseResult parsed = simulationConfigFromJson("{}");
    REQUIRE(parsed.ok);
    REQUIRE(parsed.config.img_width == 640);
    REQUIRE(parsed.config.img_height == 480);
    REQUIRE(parsed.config.fps == 10.0);
    REQUIRE(parsed.config.speed_limit == 30.0);
    REQUIRE(parsed.config.intersection_radius == 50.0);
    REQUIRE(parsed.config.reducer.self_zone.ymin_divisor == 1.6);
    REQUIRE(parsed.config.reducer.class_labels.count("car") == 1);
    REQUIRE(parsed.config.http_port == 0);
    REQUIRE(parsed.config.vehicles.empty());
}

TEST_CASE("Full config is parsed", "config")
{
    const std::string text = R"({
        "map": "Town05",
        "img_width": 1280, "img_height": 720, "n_frames": 50, "fps": 20,
        "speed_limit": 50, "intersection_radius": 40,
        "self_detection": {"ymin_divisor": 1.8, "ymax_divisor": 12},
        "class_labels": {"car": "vehicle", "truck": "vehicle", "pedestrian": "person"},
        "parallel_nodes": true, "worker_threads": 2, "http_port": 8080,
        "database": "run.db", "detections_file": "detections.json",
        "signal_cycle": {"green_seconds": 15, "orange_seconds": 3},
        "spawn_points": [[0, 0], {"x": 10, "y": 0}, [20, 0, 1]],
        "vehicles": [
            {"model": "vehicle.mini", "spawn_point": 0, "route": [1, 2], "speed": 6,
             "dimensions": {"length": 3.8, "width": 1.7, "height": 1.4},
             "camera": {"x": 1.0, "y": 0, "z": 2.0, "pitch": -10, "yaw": 0, "roll": 0}},
            {"route": [2], "camera": null}
        ],
        "rsus": [{"location": [5, 5, 6], "rotation": {"yaw": 180}}],
        "intersections": [[10, 0]],
        "pedestrians": [{"location": {"x": 3, "y": 4}}]
    })";

    ConfigParseResult parsed = simulationConfigFromJson(text);
    REQUIRE(parsed.errors.empty());
    REQUIRE(parsed.ok);

    const SimulationConfig &config = parsed.config;
    REQUIRE(config.map_name == "Town05");
    REQUIRE(config.img_width == 1280);
    REQUIRE(config.n_frames == 50);
    REQUIRE(config.fps == 20.0);
    REQUIRE(config.reducer.self_zone.ymax_divisor == 12.0);
    REQUIRE(config.reducer.class_labels.size() == 3);
    REQUIRE(config.reducer.class_labels.at("pedestrian") == DetectionClass::Person);
    REQUIRE(config.parallel_nodes);
    REQUIRE(config.worker_threads == 2);
    REQUIRE(config.http_port == 8080);
    REQUIRE(config.signal_timing.green_seconds == 15.0);
    REQUIRE(config.spawn_points.size() == 3);
    REQUIRE(config.spawn_points[2].z == 1.0);

    REQUIRE(config.vehicles.size() == 2);
    REQUIRE(config.vehicles[0].model == "vehicle.mini");
    REQUIRE(config.vehicles[0].route == std::vector<std::size_t>{1, 2});
    REQUIRE(config.vehicles[0].camera->rotation.pitch == -10.0);
    REQUIRE(config.vehicles[0].dimensions.length == 3.8);
    REQUIRE_FALSE(config.vehicles[1].spawn_point.has_value());
    REQUIRE_FALSE(config.vehicles[1].camera.has_value());

    REQUIRE(config.rsus[0].rotation.yaw == 180.0);
    REQUIRE(config.intersections[0].x == 10.0);
    REQUIRE(config.pedestrians[0].location.y == 4.0);
}

TEST_CASE("Invalid configs collect every error", "config")
{
    ConfigParseResult broken = simulationConfigFromJson("{not json");
    REQUIRE_FALSE(broken.ok);
    REQUIRE(broken.errors[0].find("invalid JSON") == 0);

    ConfigParseResult parsed = simulationConfigFromJson(R"({
        "fps": 0, "img_width": -4,
        "class_labels": {"dog": "animal"},
        "spawn_points": [[0, 0]],
        "vehicles": [{"route": [3]}, {"model": "x"}],
        "http_port": 70000
    })");
    REQUIRE_FALSE(parsed.ok);
    REQUIRE(parsed.errors.size() >= 6);
    REQUIRE(parsed.config.vehicles.empty());

    const std::string errors_json = validationErrorsToJson(parsed.errors);
    json errors = json::parse(errors_json);
    REQUIRE(errors["ok"] == false);
    REQUIRE(errors["errors"].size() == parsed.errors.size());
}

TEST_CASE("Serialized default config parses back", "config")
{
    const SimulationConfig original = makeDefaultSimulationConfig();
    ConfigParseResult parsed = simulationConfigFromJson(simulationConfigToJson(original));
    REQUIRE(parsed.ok);
    REQUIRE(parsed.config.vehicles.size() == original.vehicles.size());
    REQUIRE(parsed.config.vehicles[1].route == original.vehicles[1].route);
    REQUIRE(parsed.config.vehicles[1].cruise_speed == original.vehicles[1].cruise_speed);
    REQUIRE(parsed.config.rsus[0].rotation.yaw == original.rsus[0].rotation.yaw);
    REQUIRE(parsed.config.reducer.class_labels == original.reducer.class_labels);
}

TEST_CASE("Summary and detection JSON carry every field", "config")
{
    OutputSummary summary;
    summary.node_id = "vehicle_1";
    summary.x = 1.5;
    summary.y = -2.0;
    summary.heading = 90.0;
    summary.speed = 4.0;
    summary.tick = 12;
    DetectionRecord record;
    record.parent_id = "vehicle_1";
    record.detection_index = 3;
    record.type = DetectionClass::Person;
    record.xmax = 10;
    record.tick = 12;
    summary.detections.push_back(record);

    json one = json::parse(summaryToJson(summary));
    REQUIRE(one["node_id"] == "vehicle_1");
    REQUIRE(one["is_rsu"] == false);
    REQUIRE(one["tick"] == 12);
    REQUIRE(one["detections"][0]["type"] == "person");
    REQUIRE(one["detections"][0]["detection_id"] == 3);

    json all = json::parse(summariesToJson({{"vehicle_1", summary}}));
    REQUIRE(all["vehicle_1"]["heading"] == 90.0);

    json log = json::parse(detectionsToJson({record, record}, 5));
    REQUIRE(log["from"] == 5);
    REQUIRE(log["next"] == 7);
    REQUIRE(log["detections"].size() == 2);
}

TEST_CASE("Metadata describes the scenario", "config")
{
    SimulationConfig config = makeDefaultSimulationConfig();
    WorldStateStore store(config.fps);
    store.setSpawnPoints(config.spawn_points);
    const std::string vehicle = store.addVehicle("vehicle.tesla.model3", Dimensions{4.7, 1.8, 1.4});
    store.setRoute(vehicle, {1, 2});
    const std::string rsu = store.addRoadsideUnit(Vec3{10, 10, 6}, Rotation{-20, 225, 0}, Dimensions{0.5, 0.5, 6});
    store.addPedestrian(Dimensions{0.4, 0.4, 1.8});
    store.addCamera(vehicle, Vec3{1.5, 0, 2.4}, Rotation{});
    store.addCamera(std::nullopt, Vec3{10, 10, 6}, Rotation{-20, 225, 0});
    const std::string intersection = store.addIntersection(Vec3{});
    store.recordCongestionSample(intersection, true);

    json meta = json::parse(metadataToJson(store, config, "2024-01-01_00-00-00"));
    REQUIRE(meta["timestamp"] == "2024-01-01_00-00-00");
    REQUIRE(meta["map"] == "Town10");
    REQUIRE(meta["waypoints"].size() == 6);
    REQUIRE(meta["waypoints"][0][0] == -120.0);
    REQUIRE(meta["n_vehicles"] == 1);
    REQUIRE(meta["n_sensors"] == 2);
    REQUIRE(meta["n_pedestrians"] == 1);
    REQUIRE(meta["vehicles"][0]["model"] == "vehicle.tesla.model3");
    REQUIRE(meta["vehicles"][0]["length"] == 4.7);
    REQUIRE(meta["rsus"][0]["id"] == rsu);
    REQUIRE(meta["sensors"][0]["parent_id"] == vehicle);
    REQUIRE(meta["sensors"][1]["parent_id"].is_null());
    REQUIRE(meta["sensors"][1]["rotation"]["yaw"] == 225.0);
    REQUIRE(meta["congestion_statistics"][intersection] == 1);
    REQUIRE(meta["travel_times"][vehicle] == 0.0);

    SchedulerMetrics metrics;
    metrics.ticks_run = 4;
    json report = json::parse(metricsToJson(store, metrics));
    REQUIRE(report["ticks_run"] == 4);
    REQUIRE(report["congestion"][intersection]["ratio"] == 1.0);
    REQUIRE(report["arrived"].empty());
}
