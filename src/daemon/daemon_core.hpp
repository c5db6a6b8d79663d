#pragma once

#include "config.hpp"
#include "output/output.hpp"
#include "platform/audio_chunk_source.hpp"
#include "platform/ipc_server.hpp"
#include "session/checkpoint_store.hpp"
#include "session/result_sink.hpp"
#include "session/session_controller.hpp"
#include "storage/history_db.hpp"
#include "util/executor.hpp"
#include "util/scheduler.hpp"
#include "whisper/backend.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

ControllerOptions controller_options(const Config& config);

// "completed", "incomplete" or "recovered".
const char* history_status(const AssembledTranscript& transcript);

// Portable daemon logic: owns the session controller, delivers its
// transcripts, records history and answers IPC commands.
//
// deliver() and the notice callback run on controller threads. Replies for
// clients waiting on a stop are queued and handed out by on_results_ready()
// on the event loop thread after notify() has woken it.
class DaemonCore : public ResultSink {
public:
    using OutputFactory = std::function<std::unique_ptr<OutputMethod>(OutputKind)>;
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               AudioChunkSource& source, WhisperBackend& backend,
               Executor& executor, Scheduler& scheduler,
               CheckpointStore* checkpoints, IpcServer& ipc,
               OutputFactory output_factory, NotifyCallback notify);
    ~DaemonCore() override;

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens history (unless disabled) and prunes old entries.
    bool init(const std::string& history_path);

    // Finishes sessions left behind by a crash. Returns how many were recovered.
    size_t recover();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void deliver(const AssembledTranscript& transcript) override;

    void on_results_ready();

    // The reply for client_fd is sent once session_id has been delivered or aborted.
    void add_waiting_client(int fd, const std::string& session_id);
    void remove_waiting_client(int fd);

    SessionController& controller() { return controller_; }
    HistoryDb& history() { return history_db_; }

    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_discard(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_search(const nlohmann::json& cmd);
    nlohmann::json handle_stats(const nlohmann::json& cmd);
    nlohmann::json handle_delete(const nlohmann::json& cmd);
    nlohmann::json handle_export(const nlohmann::json& cmd);

    void on_notice(const Notice& notice);
    void complete(const std::string& session_id, nlohmann::json response);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    WhisperBackend& backend_;
    CheckpointStore* checkpoints_;
    IpcServer& ipc_;

    OutputFactory output_factory_;
    NotifyCallback notify_;

    HistoryDb history_db_;
    bool history_open_ = false;

    std::mutex mu_;
    OutputKind default_output_;
    OutputKind next_output_;             // for the session started by the next engage
    std::optional<Notice> last_notice_;
    std::vector<std::pair<std::string, nlohmann::json>> completed_; // by session id

    // Event loop thread only.
    struct WaitingClient {
        int fd;
        std::string session_id;
    };
    std::vector<WaitingClient> waiting_clients_;

    // Declared last: its threads call back into the members above.
    SessionController controller_;
};
