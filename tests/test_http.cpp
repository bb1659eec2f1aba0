#include <catch2/catch.hpp>
#include "SummaryHttpServer.hpp"

#include <vector>

using namespace edgesim;

namespace
{
    struct Recorder
    {
        std::vector<std::string> commands;
        std::size_t last_since = 999;
    };

    SummaryHttpServer makeServer(Recorder &recorder)
    {
        return SummaryHttpServer(
            0,
            [](const std::optional<std::string> &node_id) -> std::optional<std::string>
            {
                if (!node_id.has_value())
                    return std::string("{\"all\":true}");
                if (*node_id == "vehicle_1")
                    return std::string("{\"node_id\":\"vehicle_1\"}");
                return std::nullopt;
            },
            [&recorder](std::size_t since)
            {
                recorder.last_since = since;
                return std::string("{\"detections\":[]}");
            },
            []()
            { return std::string("{\"meta\":1}"); },
            []()
            { return std::string("{\"metrics\":1}"); },
            [&recorder](const std::string &cmd)
            {
                if (cmd != "start" && cmd != "stop" && cmd != "step")
                    return false;
                recorder.commands.push_back(cmd);
                return true;
            });
    }
}

TEST_CASE("Summaries route serves all nodes or one", "http")
{
    Recorder recorder;
    SummaryHttpServer server = makeServer(recorder);

    SummaryHttpServer::Response all = server.handleRequest("GET", "/summaries");
    REQUIRE(all.status_code == 200);
    REQUIRE(all.body == "{\"all\":true}");

    SummaryHttpServer::Response one = server.handleRequest("GET", "/summaries?node=vehicle_1");
    REQUIRE(one.status_code == 200);
    REQUIRE(one.body.find("vehicle_1") != std::string::npos);

    REQUIRE(server.handleRequest("GET", "/summaries?node=rsu_9").status_code == 404);
}

TEST_CASE("Detections route parses the since index", "http")
{
    Recorder recorder;
    SummaryHttpServer server = makeServer(recorder);

    REQUIRE(server.handleRequest("GET", "/detections").status_code == 200);
    REQUIRE(recorder.last_since == 0);
    REQUIRE(server.handleRequest("GET", "/detections?since=42").status_code == 200);
    REQUIRE(recorder.last_since == 42);
    REQUIRE(server.handleRequest("GET", "/detections?since=-1").status_code == 400);
    REQUIRE(server.handleRequest("GET", "/detections?since=").status_code == 400);
}

TEST_CASE("Commands, metadata and unknown routes", "http")
{
    Recorder recorder;
    SummaryHttpServer server = makeServer(recorder);

    REQUIRE(server.handleRequest("GET", "/command?cmd=step").status_code == 200);
    REQUIRE(server.handleRequest("GET", "/command?cmd=start&x=1").status_code == 200);
    REQUIRE(recorder.commands == std::vector<std::string>{"step", "start"});
    REQUIRE(server.handleRequest("GET", "/command?cmd=reset").status_code == 400);
    REQUIRE(server.handleRequest("GET", "/command").status_code == 400);

    REQUIRE(server.handleRequest("GET", "/metadata").body == "{\"meta\":1}");
    REQUIRE(server.handleRequest("GET", "/metrics").body == "{\"metrics\":1}");
    REQUIRE(server.handleRequest("POST", "/metrics").status_code == 405);
    REQUIRE(server.handleRequest("GET", "/nope").status_code == 404);
}
