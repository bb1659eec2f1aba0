#include "SummaryHttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cctype>
#include <cstring>
#include <iostream>
#include <sstream>

namespace edgesim
{
    namespace
    {
        std::string decodePath(const std::string &path)
        {
            if (path == "/summaries" || path == "/summaries/")
            {
                return "summaries";
            }
            if (path == "/detections" || path == "/detections/")
            {
                return "detections";
            }
            if (path == "/metadata" || path == "/metadata.json")
            {
                return "metadata";
            }
            if (path == "/metrics")
            {
                return "metrics";
            }
            if (path.rfind("/command", 0) == 0)
            {
                return "command";
            }
            return "unknown";
        }

        std::string statusTextFromCode(int status_code)
        {
            switch (status_code)
            {
            case 200:
                return "200 OK";
            case 400:
                return "400 Bad Request";
            case 404:
                return "404 Not Found";
            case 405:
                return "405 Method Not Allowed";
            case 500:
                return "500 Internal Server Error";
            default:
                return std::to_string(status_code) + " Unknown";
            }
        }

        std::optional<std::string> extractParam(const std::string &target, const std::string &name)
        {
            const std::size_t qmark = target.find('?');
            if (qmark == std::string::npos)
            {
                return std::nullopt;
            }
            const std::string key = name + "=";
            std::size_t pos = qmark + 1;
            while (pos < target.size())
            {
                std::size_t amp = target.find('&', pos);
                if (amp == std::string::npos)
                {
                    amp = target.size();
                }
                if (target.compare(pos, key.size(), key) == 0)
                {
                    return target.substr(pos + key.size(), amp - pos - key.size());
                }
                pos = amp + 1;
            }
            return std::nullopt;
        }

        bool parseIndex(const std::string &text, std::size_t &value)
        {
            if (text.empty() || text.size() > 18)
            {
                return false;
            }
            value = 0;
            for (char c : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                {
                    return false;
                }
                value = value * 10 + static_cast<std::size_t>(c - '0');
            }
            return true;
        }

        SummaryHttpServer::Response errorResponse(int status_code, const std::string &message)
        {
            SummaryHttpServer::Response response;
            response.status_code = status_code;
            response.body = "{\"ok\":false,\"error\":\"" + message + "\"}";
            return response;
        }
    } // namespace

    SummaryHttpServer::SummaryHttpServer(int port,
                                         SummariesProvider summaries_provider,
                                         DetectionsProvider detections_provider,
                                         JsonProvider metadata_provider,
                                         JsonProvider metrics_provider,
                                         CommandHandler command_handler)
        : port(port),
          server_fd(-1),
          running(false),
          summaries_provider(std::move(summaries_provider)),
          detections_provider(std::move(detections_provider)),
          metadata_provider(std::move(metadata_provider)),
          metrics_provider(std::move(metrics_provider)),
          command_handler(std::move(command_handler))
    {
    }

    SummaryHttpServer::~SummaryHttpServer()
    {
        stop();
    }

    bool SummaryHttpServer::start()
    {
        server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (server_fd < 0)
        {
            std::cerr << "HTTP server: failed to create socket\n";
            return false;
        }

        int opt = 1;
        setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(port));

        if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
        {
            std::cerr << "HTTP server: bind failed on port " << port << "\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        if (listen(server_fd, 16) < 0)
        {
            std::cerr << "HTTP server: listen failed\n";
            close(server_fd);
            server_fd = -1;
            return false;
        }

        running = true;
        accept_thread = std::thread(&SummaryHttpServer::acceptLoop, this);
        return true;
    }

    void SummaryHttpServer::stop()
    {
        if (!running)
        {
            return;
        }

        running = false;
        if (server_fd >= 0)
        {
            shutdown(server_fd, SHUT_RDWR);
            close(server_fd);
            server_fd = -1;
        }

        if (accept_thread.joinable())
        {
            accept_thread.join();
        }
    }

    void SummaryHttpServer::acceptLoop()
    {
        while (running)
        {
            sockaddr_in client_addr{};
            socklen_t len = sizeof(client_addr);
            int client_fd = accept(server_fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
            if (client_fd < 0)
            {
                if (running)
                {
                    continue;
                }
                break;
            }

            handleClient(client_fd);
            close(client_fd);
        }
    }

    void SummaryHttpServer::handleClient(int client_fd)
    {
        char buffer[8192];
        std::memset(buffer, 0, sizeof(buffer));
        int n = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
        if (n <= 0)
        {
            return;
        }

        std::string req(buffer, n);
        std::istringstream input(req);
        std::string method, target, version;
        input >> method >> target >> version;

        Response response = handleRequest(method, target);
        std::string resp = buildHttpResponse(statusTextFromCode(response.status_code), response.content_type, response.body);
        send(client_fd, resp.c_str(), resp.size(), 0);
    }

    SummaryHttpServer::Response SummaryHttpServer::handleRequest(const std::string &method, const std::string &target) const
    {
        const std::size_t qmark = target.find('?');
        const std::string clean_path = qmark == std::string::npos ? target : target.substr(0, qmark);
        const std::string route = decodePath(clean_path);

        if (route == "unknown")
        {
            return errorResponse(404, "not found");
        }
        if (method != "GET")
        {
            return errorResponse(405, "method not allowed");
        }

        Response response;
        if (route == "summaries")
        {
            std::optional<std::string> body = summaries_provider(extractParam(target, "node"));
            if (!body.has_value())
            {
                return errorResponse(404, "unknown node");
            }
            response.body = *body;
            return response;
        }

        if (route == "detections")
        {
            std::size_t since = 0;
            std::optional<std::string> since_text = extractParam(target, "since");
            if (since_text.has_value() && !parseIndex(*since_text, since))
            {
                return errorResponse(400, "since must be a non-negative integer");
            }
            response.body = detections_provider(since);
            return response;
        }

        if (route == "metadata")
        {
            response.body = metadata_provider();
            return response;
        }

        if (route == "metrics")
        {
            response.body = metrics_provider();
            return response;
        }

        std::optional<std::string> cmd = extractParam(target, "cmd");
        if (!cmd.has_value() || !command_handler(*cmd))
        {
            return errorResponse(400, "unknown command");
        }
        response.content_type = "text/plain";
        response.body = "ok";
        return response;
    }

    std::string SummaryHttpServer::buildHttpResponse(const std::string &status,
                                                     const std::string &content_type,
                                                     const std::string &body) const
    {
        std::ostringstream out;
        out << "HTTP/1.1 " << status << "\r\n";
        out << "Content-Type: " << content_type << "\r\n";
        out << "Cache-Control: no-store, no-cache, must-revalidate, max-age=0\r\n";
        out << "Content-Length: " << body.size() << "\r\n";
        out << "Connection: close\r\n\r\n";
        out << body;
        return out.str();
    }
} // namespace edgesim
