#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace edgesim
{
    // Read-only JSON view over a running simulation plus start/stop/step control.
    //   GET /summaries[?node=<id>]   latest summary per node
    //   GET /detections?since=<n>     detection log entries from index n
    //   GET /metadata                 scenario snapshot
    //   GET /metrics                  travel times, congestion, scheduler counters
    //   GET /command?cmd=start|stop|step
    class SummaryHttpServer
    {
    public:
        struct Response
        {
            int status_code = 200;
            std::string content_type = "application/json";
            std::string body;
        };

        using SummariesProvider = std::function<std::optional<std::string>(const std::optional<std::string> &node_id)>;
        using DetectionsProvider = std::function<std::string(std::size_t since)>;
        using JsonProvider = std::function<std::string()>;
        using CommandHandler = std::function<bool(const std::string &)>;

        SummaryHttpServer(int port,
                          SummariesProvider summaries_provider,
                          DetectionsProvider detections_provider,
                          JsonProvider metadata_provider,
                          JsonProvider metrics_provider,
                          CommandHandler command_handler);
        ~SummaryHttpServer();

        bool start();
        void stop();

        Response handleRequest(const std::string &method, const std::string &target) const;

    private:
        void acceptLoop();
        void handleClient(int client_fd);
        std::string buildHttpResponse(const std::string &status,
                                      const std::string &content_type,
                                      const std::string &body) const;

        int port;
        int server_fd;
        std::atomic<bool> running;
        std::thread accept_thread;
        SummariesProvider summaries_provider;
        DetectionsProvider detections_provider;
        JsonProvider metadata_provider;
        JsonProvider metrics_provider;
        CommandHandler command_handler;
    };
} // namespace edgesim
