#pragma once

#include <chrono>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Client side of the daemon's newline-delimited JSON protocol.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual std::expected<void, std::string> connect(const std::string& endpoint) = 0;
    virtual std::expected<void, std::string> send(const nlohmann::json& cmd) = 0;
    // Waits for one reply line. Bytes after it are kept for the next call.
    virtual std::expected<nlohmann::json, std::string> recv(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};
