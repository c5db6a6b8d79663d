#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

UnixSocketClient::~UnixSocketClient() {
    close();
}

std::expected<void, std::string> UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{.sun_family = AF_UNIX, .sun_path = {}};
    if (endpoint.empty() || endpoint.size() >= sizeof(addr.sun_path)) {
        return std::unexpected("invalid socket path: " + endpoint);
    }
    std::memcpy(addr.sun_path, endpoint.data(), endpoint.size());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(std::string("socket() failed: ") + std::strerror(errno));
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(endpoint + ": " + std::strerror(err));
    }

    fd_ = fd;
    return {};
}

std::expected<void, std::string> UnixSocketClient::send(const json& cmd) {
    if (fd_ < 0) return std::unexpected("not connected");

    std::string line = cmd.dump() + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::send(fd_, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("send failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    return {};
}

std::expected<json, std::string> UnixSocketClient::recv(std::chrono::milliseconds timeout) {
    if (fd_ < 0) return std::unexpected("not connected");

    // One deadline for the whole reply, however many reads it takes.
    auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        auto pos = pending_.find('\n');
        if (pos != std::string::npos) {
            std::string line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            try {
                return json::parse(line);
            } catch (const json::exception& e) {
                return std::unexpected(std::string("malformed reply: ") + e.what());
            }
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return std::unexpected("timed out waiting for the daemon");

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) continue;

        char buf[4096];
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return std::unexpected(std::string("recv failed: ") + std::strerror(errno));
        }
        if (n == 0) return std::unexpected("daemon closed the connection");
        pending_.append(buf, static_cast<size_t>(n));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_.clear();
}
