#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Newline-delimited JSON request/response transport.
class IpcServer {
public:
    enum class ReadResult {
        Command, // cmd holds one complete message
        Pending, // no complete line buffered yet
        Closed,  // peer hung up, read error or malformed message
    };

    virtual ~IpcServer() = default;
    virtual std::expected<void, std::string> start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadResult read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
