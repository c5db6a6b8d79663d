#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

std::expected<void, std::string> daemonize() {
    pid_t pid = ::fork();
    if (pid < 0) return std::unexpected(errno_message("fork"));
    if (pid > 0) ::_exit(0);

    if (::setsid() < 0) return std::unexpected(errno_message("setsid"));

    // The second fork makes sure the daemon can never reacquire a terminal.
    pid = ::fork();
    if (pid < 0) return std::unexpected(errno_message("fork"));
    if (pid > 0) ::_exit(0);

    // The working directory is kept: backend.model may be a relative path.
    ::umask(077);

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (devnull < 0) return std::unexpected(errno_message("open /dev/null"));
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        if (::dup2(devnull, fd) < 0) {
            ::close(devnull);
            return std::unexpected(errno_message("dup2"));
        }
    }
    ::close(devnull);
    return {};
}

} // namespace platform
