#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <unordered_map>

// Owner-only AF_UNIX stream socket. All calls come from the event loop thread.
class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer() = default;
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    // Fails if another daemon still answers on endpoint. A socket file
    // nobody listens on is replaced.
    std::expected<void, std::string> start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return listen_fd_; }
    int accept_client() override;
    // Serves a line already buffered before reading more from the socket, so
    // callers should loop until Pending.
    ReadResult read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

    // A client sending more than this without a newline is dropped.
    static constexpr size_t kMaxLineBytes = 64 * 1024;

private:
    int listen_fd_ = -1;
    std::string bound_path_;
    std::unordered_map<int, std::string> partial_lines_; // by client fd
};
