#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    std::expected<void, std::string> connect(const std::string& endpoint) override;
    std::expected<void, std::string> send(const nlohmann::json& cmd) override;
    std::expected<nlohmann::json, std::string> recv(std::chrono::milliseconds timeout) override;
    void close() override;

    bool connected() const { return fd_ >= 0; }

private:
    int fd_ = -1;
    std::string pending_; // received bytes not yet returned as a reply
};
