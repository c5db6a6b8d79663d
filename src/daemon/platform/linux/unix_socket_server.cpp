#include "platform/linux/unix_socket_server.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <optional>
#include <poll.h>
#include <print>
#include <string_view>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

std::string sys_error(const char* call) {
    return std::format("{}() failed: {}", call, std::strerror(errno));
}

std::optional<sockaddr_un> make_address(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) return std::nullopt;
    std::memcpy(addr.sun_path, path.data(), path.size());
    return addr;
}

// True when something accepts connections on addr.
bool in_use(const sockaddr_un& addr) {
    int peer = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (peer < 0) return false;
    bool answered = ::connect(peer, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(peer);
    return answered;
}

std::optional<std::string> pop_line(std::string& pending) {
    auto newline = pending.find('\n');
    if (newline == std::string::npos) return std::nullopt;
    std::string line(pending, 0, newline);
    pending.erase(0, newline + 1);
    return line;
}

} // namespace

UnixSocketServer::~UnixSocketServer() {
    stop();
}

std::expected<void, std::string> UnixSocketServer::start(const std::string& endpoint) {
    auto addr = make_address(endpoint);
    if (!addr) {
        return std::unexpected("invalid socket path: " + endpoint);
    }
    if (in_use(*addr)) {
        return std::unexpected("another daemon is listening on " + endpoint);
    }
    ::unlink(endpoint.c_str());

    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        return std::unexpected(sys_error("socket"));
    }

    // Transcripts travel over this socket; only the owner may connect.
    mode_t old_mask = ::umask(S_IRWXG | S_IRWXO);
    int bound = ::bind(listen_fd_, reinterpret_cast<const sockaddr*>(&*addr), sizeof(*addr));
    int bind_errno = errno;
    ::umask(old_mask);
    if (bound < 0) {
        errno = bind_errno;
        auto err = sys_error("bind");
        ::close(listen_fd_);
        listen_fd_ = -1;
        return std::unexpected(err);
    }
    bound_path_ = endpoint;

    if (::listen(listen_fd_, SOMAXCONN) < 0) {
        auto err = sys_error("listen");
        stop();
        return std::unexpected(err);
    }
    return {};
}

void UnixSocketServer::stop() {
    for (const auto& [fd, line] : partial_lines_) {
        ::close(fd);
    }
    partial_lines_.clear();

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!bound_path_.empty()) {
        ::unlink(bound_path_.c_str());
        bound_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd >= 0) partial_lines_[fd];
    return fd;
}

IpcServer::ReadResult UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto it = partial_lines_.find(client_fd);
    if (it == partial_lines_.end()) return ReadResult::Closed;
    std::string& pending = it->second;

    auto line = pop_line(pending);
    while (!line) {
        char chunk[4096];
        ssize_t n = ::recv(client_fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return ReadResult::Pending;
        if (n <= 0) return ReadResult::Closed;

        pending.append(chunk, static_cast<size_t>(n));
        line = pop_line(pending);
        if (!line && pending.size() > kMaxLineBytes) {
            std::println(stderr, "ipc: client {} sent {} bytes without a newline", client_fd,
                         pending.size());
            return ReadResult::Closed;
        }
    }

    try {
        cmd = nlohmann::json::parse(*line);
    } catch (const nlohmann::json::parse_error& e) {
        std::println(stderr, "ipc: malformed message: {}", e.what());
        return ReadResult::Closed;
    }
    return cmd.is_object() ? ReadResult::Command : ReadResult::Closed;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string out = response.dump();
    out.push_back('\n');

    std::string_view rest = out;
    while (!rest.empty()) {
        ssize_t n = ::send(client_fd, rest.data(), rest.size(), MSG_NOSIGNAL);
        if (n >= 0) {
            rest.remove_prefix(static_cast<size_t>(n));
            continue;
        }
        if (errno == EINTR) continue;
        // Nonblocking client socket: give a slow reader one second per stall.
        pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
        if ((errno != EAGAIN && errno != EWOULDBLOCK) || ::poll(&pfd, 1, 1000) <= 0) {
            return false;
        }
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    if (partial_lines_.erase(client_fd) > 0) {
        ::close(client_fd);
    }
}
