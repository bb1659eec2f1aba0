#include <catch2/catch.hpp>
#include "DetectionReducer.hpp"
#include "TestWorld.hpp"

using namespace edgesim;

namespace
{
    constexpr uint32_t W = 640;
    constexpr uint32_t H = 480;

    EntityState vehicleOwner()
    {
        return test::makeState("vehicle_1", 0, 0);
    }

    EntityState rsuOwner()
    {
        EntityState state = test::makeState("rsu_1", 0, 0);
        state.is_rsu = true;
        return state;
    }
}

TEST_CASE("Vehicle camera drops its own hood, unknown classes and keeps people", "reducer")
{
    RawDetectionTable table = {
        test::makeRow("car", 100, 0.7 * H, 400, 0.9 * H),
        test::makeRow("dog", 10, 10, 50, 50),
        test::makeRow("person", 200, 100, 240, 220)};

    DetectionReducer reducer;
    ReduceResult result = reducer.reduce(table, W, H, vehicleOwner(), "vehicle_1", 12);

    REQUIRE(result.detections.size() == 1);
    const DetectionRecord &person = result.detections[0];
    REQUIRE(person.type == DetectionClass::Person);
    REQUIRE(person.detection_index == 2);
    REQUIRE(person.parent_id == "vehicle_1");
    REQUIRE(person.tick == 12);
    REQUIRE(person.ymax == 220);
    REQUIRE(result.dropped_as_self == 1);
    REQUIRE(result.dropped_by_class == 1);
    REQUIRE(result.dropped_malformed == 0);
}

TEST_CASE("RSU cameras never suppress self-detections", "reducer")
{
    RawDetectionTable table = {test::makeRow("car", 100, 0.7 * H, 400, 0.9 * H)};

    DetectionReducer reducer;
    ReduceResult result = reducer.reduce(table, W, H, rsuOwner(), "rsu_1", 0);

    REQUIRE(result.detections.size() == 1);
    REQUIRE(result.detections[0].type == DetectionClass::Vehicle);
    REQUIRE(result.dropped_as_self == 0);
}

TEST_CASE("Self-detection needs both thresholds", "reducer")
{
    DetectionReducer reducer;
    // ymin limit 300, ymax limit 30
    REQUIRE(reducer.isSelfDetection(301, 400, H));
    REQUIRE_FALSE(reducer.isSelfDetection(300, 400, H));
    REQUIRE_FALSE(reducer.isSelfDetection(100, 400, H));

    // People in the hood zone are kept
    RawDetectionTable table = {test::makeRow("person", 100, 0.8 * H, 140, 0.95 * H)};
    ReduceResult result = reducer.reduce(table, W, H, vehicleOwner(), "vehicle_1", 0);
    REQUIRE(result.detections.size() == 1);
}

TEST_CASE("Malformed rows are dropped and reported", "reducer")
{
    RawDetection no_label = test::makeRow("car", 1, 2, 3, 4);
    no_label.class_label.reset();
    RawDetection no_box = test::makeRow("person", 1, 2, 3, 4);
    no_box.ymax.reset();
    RawDetection inverted = test::makeRow("person", 50, 2, 10, 4);

    RawDetectionTable table = {no_label, no_box, inverted, test::makeRow("vehicle", 10, 10, 60, 40)};

    DetectionReducer reducer;
    ReduceResult result = reducer.reduce(table, W, H, vehicleOwner(), "vehicle_1", 3);

    REQUIRE(result.dropped_malformed == 3);
    REQUIRE(result.errors.size() == 3);
    REQUIRE(result.detections.size() == 1);
    REQUIRE(result.detections[0].detection_index == 3);
}

TEST_CASE("Label map and thresholds are configurable", "reducer")
{
    ReducerConfig config;
    config.class_labels = {{"truck", DetectionClass::Vehicle}};
    config.self_zone.ymin_divisor = 1.2;

    DetectionReducer reducer(config);
    RawDetectionTable table = {
        test::makeRow("car", 0, 0, 10, 10),
        test::makeRow("truck", 100, 0.7 * H, 400, 0.9 * H)};
    ReduceResult result = reducer.reduce(table, W, H, vehicleOwner(), "vehicle_1", 0);

    REQUIRE(result.dropped_by_class == 1);
    REQUIRE(result.detections.size() == 1);
    REQUIRE(result.detections[0].detection_index == 1);
}

TEST_CASE("Replay model serves tables by camera and tick", "reducer")
{
    ReplayDetectionModel model;
    std::string error;
    REQUIRE(model.loadFromJson(R"({"camera_1": {"0": [{"name": "car", "confidence": 0.8, "xmin": 1, "ymin": 2, "xmax": 3, "ymax": 4},
                                                     {"class_label": "person", "xmin": 5}]}})",
                               &error));
    REQUIRE(model.getTableCount() == 1);

    CameraFrame frame;
    frame.sensor_id = "camera_1";
    frame.tick = 0;
    RawDetectionTable table = model.infer(frame);
    REQUIRE(table.size() == 2);
    REQUIRE(table[0].class_label.value() == "car");
    REQUIRE(table[0].ymax.value() == 4);
    REQUIRE(table[1].class_label.value() == "person");
    REQUIRE_FALSE(table[1].ymin.has_value());

    frame.tick = 1;
    REQUIRE(model.infer(frame).empty());

    REQUIRE_FALSE(model.loadFromJson("{\"camera_1\": {\"x\": []}}", &error));
    REQUIRE_FALSE(model.loadFromJson("not json", &error));
    REQUIRE(error.find("invalid JSON") != std::string::npos);
}
