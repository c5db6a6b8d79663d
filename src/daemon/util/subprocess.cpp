#include "util/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_message(const char* what) {
    return std::format("{}() failed: {}", what, std::strerror(errno));
}

// Sets up the child's stdio and execs. Only async-signal-safe calls.
[[noreturn]] void exec_child(char* const* argv, int stdin_fd) {
    // An ignored SIGPIPE would survive exec.
    ::signal(SIGPIPE, SIG_DFL);
    int devnull = ::open("/dev/null", O_RDWR);
    if (stdin_fd < 0) stdin_fd = devnull;
    if (stdin_fd >= 0) ::dup2(stdin_fd, STDIN_FILENO);
    if (devnull >= 0) {
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
    }
    ::execvp(argv[0], argv);
    ::_exit(127);
}

std::expected<void, std::string> feed(int fd, const std::string& input) {
    size_t written = 0;
    while (written < input.size()) {
        ssize_t n = ::write(fd, input.data() + written, input.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("write"));
        }
        written += static_cast<size_t>(n);
    }
    return {};
}

std::expected<int, std::string> wait_for(pid_t pid, const std::string& program,
                                         std::chrono::milliseconds timeout) {
    int status = 0;
    if (timeout.count() <= 0) {
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) return std::unexpected(errno_message("waitpid"));
        }
        return status;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return status;
        if (r < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("waitpid"));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return std::unexpected(program + " timed out");
        }
        ::usleep(20000);
    }
}

} // namespace

std::expected<void, std::string> run_process(const std::vector<std::string>& argv,
                                             const ProcessOptions& options) {
    if (argv.empty()) return std::unexpected("empty command line");
    const std::string& program = argv.front();

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (options.input && ::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe"));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno_message("fork");
        if (pipefd[0] >= 0) {
            ::close(pipefd[0]);
            ::close(pipefd[1]);
        }
        return std::unexpected(err);
    }
    if (pid == 0) exec_child(args.data(), pipefd[0]);

    std::expected<void, std::string> fed;
    if (options.input) {
        ::close(pipefd[0]);
        fed = feed(pipefd[1], *options.input);
        ::close(pipefd[1]);
    }

    auto status = wait_for(pid, program, options.timeout);
    if (!status) return std::unexpected(status.error());
    if (WIFEXITED(*status) && WEXITSTATUS(*status) == 127) {
        return std::unexpected("cannot execute " + program);
    }
    if (!fed) return fed;
    if (WIFSIGNALED(*status)) {
        return std::unexpected(std::format("{} killed by signal {}", program, WTERMSIG(*status)));
    }
    if (WEXITSTATUS(*status) != 0) {
        return std::unexpected(std::format("{} exited with code {}", program, WEXITSTATUS(*status)));
    }
    return {};
}
