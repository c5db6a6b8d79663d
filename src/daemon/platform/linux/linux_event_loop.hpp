#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/evdev_key_source.hpp"
#include "platform/linux/pipewire_chunk_source.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "session/checkpoint_store.hpp"
#include "util/timer_thread.hpp"
#include "util/worker_pool.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <memory>

std::unique_ptr<WhisperBackend> make_backend(const Config& config);

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();

private:
    bool start_hotkey();
    void handle_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    std::unique_ptr<WhisperBackend> backend_;
    PipeWireChunkSource audio_source_;
    std::unique_ptr<EvdevKeySource> key_source_;
    UnixSocketServer ipc_server_;
    JsonCheckpointStore checkpoints_;
    WorkerPool workers_;
    TimerThread timers_;

    // Portable business logic
    DaemonCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int result_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
