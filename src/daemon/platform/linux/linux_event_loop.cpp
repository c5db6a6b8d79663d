#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/wayland_clipboard_output.hpp"
#include "platform/linux/wayland_type_output.hpp"
#include "platform/platform_paths.hpp"
#include "whisper/command_backend.hpp"
#include "whisper/lan_backend.hpp"
#include "whisper/vocabulary.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

std::string data_path(const std::string& leaf) {
    auto data = platform::data_dir();
    return (data.empty() ? std::string("/tmp/holdscribe") : data) + "/" + leaf;
}

// A missing vocabulary file leaves the inline terms in effect.
std::string initial_prompt(const Config::Backend& backend) {
    auto terms = backend.vocabulary;
    if (!backend.vocabulary_file.empty()) {
        auto loaded = vocabulary::load_file(backend.vocabulary_file);
        if (loaded) {
            terms.insert(terms.end(), loaded->begin(), loaded->end());
        } else {
            std::println(stderr, "Vocabulary: {}", loaded.error());
        }
    }
    return vocabulary::build_prompt(backend.prompt, terms);
}

} // namespace

std::unique_ptr<WhisperBackend> make_backend(const Config& config) {
    auto timeout = std::chrono::seconds(config.backend.timeout_seconds);
    if (config.backend.type == "lan") {
        return std::make_unique<LanBackend>(config.backend.url, config.backend.api_format,
                                            config.backend.language, timeout,
                                            initial_prompt(config.backend));
    }
    if (config.backend.type == "command") {
        return std::make_unique<CommandBackend>(config.backend.binary, config.backend.model,
                                                config.backend.language, timeout,
                                                initial_prompt(config.backend));
    }
    return nullptr;
}

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      backend_(make_backend(config_)),
      audio_source_(verbose_),
      checkpoints_(data_path("autosave")),
      workers_(config_.session.max_parallel_transcriptions),
      core_(config_, verbose_, audio_source_, *backend_, workers_, timers_,
            &checkpoints_, ipc_server_,
            // OutputFactory
            [this](OutputKind kind) -> std::unique_ptr<OutputMethod> {
                if (kind == OutputKind::Type) {
                    return std::make_unique<WaylandTypeOutput>(config_.output.terminal);
                }
                return std::make_unique<WaylandClipboardOutput>();
            },
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(result_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (key_source_) key_source_->stop();
    workers_.stop();
    timers_.stop();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (result_event_fd_ >= 0) ::close(result_event_fd_);
}

bool LinuxEventLoop::init() {
    // Result notification eventfd, needed before anything can be delivered
    result_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (result_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (auto listening = ipc_server_.start(ipc_path); !listening) {
        std::println(stderr, "ipc: {}", listening.error());
        return false;
    }
    log("IPC listening on " + ipc_path);

    // Core init (history db)
    if (!core_.init(data_path("history.db"))) return false;

    // Sessions interrupted by a crash
    core_.recover();

    // Global hotkey (optional: IPC keeps working without it)
    if (!start_hotkey()) {
        log("Hotkey disabled, use holdscribe-ctl start/stop");
    }

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(result_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

bool LinuxEventLoop::start_hotkey() {
    auto keys = make_key_map(config_.hotkey.modifier, config_.hotkey.key);
    if (!keys) {
        std::println(stderr, "hotkey: {}", keys.error());
        return false;
    }

    key_source_ = std::make_unique<EvdevKeySource>(*keys, config_.hotkey.device, verbose_);

    // Key events are handed to the timer thread so that engage() and the
    // blocking source stop never run on the evdev reader.
    auto started = key_source_->start([this](LogicalKey key, KeyTransition transition) {
        timers_.schedule(0ms, [this, key, transition] {
            core_.controller().on_key_event(key, transition);
        });
    });
    if (!started) {
        std::println(stderr, "hotkey: {}", started.error());
        key_source_.reset();
        return false;
    }

    log(std::format("Hotkey {}+{} on {}", config_.hotkey.modifier, config_.hotkey.key,
                    key_source_->device()));
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == result_event_fd_) {
                uint64_t val;
                if (::read(result_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_results_ready();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown: no new key events, then let the current session finish.
    if (key_source_) key_source_->stop();
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    for (;;) {
        nlohmann::json cmd;
        auto read = ipc_server_.read_command(fd, cmd);
        if (read == IpcServer::ReadResult::Pending) return;

        if (read == IpcServer::ReadResult::Closed) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            ipc_server_.close_client(fd);
            core_.remove_waiting_client(fd);
            return;
        }

        std::string cmd_str = cmd.value("cmd", "");
        auto response = core_.handle_command(cmd_str, cmd);

        if (response.value("status", "") == "finalizing") {
            core_.add_waiting_client(fd, response.value("session_id", ""));
        } else {
            ipc_server_.send_response(fd, response);
        }
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[holdscribe] {}", msg);
    }
}
