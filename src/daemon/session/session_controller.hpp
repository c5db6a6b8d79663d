#pragma once

#include "hotkey/key_combo_tracker.hpp"
#include "platform/audio_chunk_source.hpp"
#include "session/checkpoint_store.hpp"
#include "session/recording_session.hpp"
#include "session/result_sink.hpp"
#include "session/transcript_assembler.hpp"
#include "util/executor.hpp"
#include "util/scheduler.hpp"
#include "whisper/backend.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

enum class ControllerState { Idle, Recording, Finalizing };

enum class StopReason { Released, ForceStop, MaxDuration };

const char* to_string(ControllerState state);
const char* to_string(StopReason reason);

// User-facing notices. Everything else degrades into lower confidence.
struct Notice {
    enum class Kind { MaxDuration, Aborted };
    Kind kind;
    std::string session_id;
    std::string message;
};

struct ControllerOptions {
    ChunkFormat format;
    std::chrono::milliseconds max_duration{std::chrono::hours(1)};
    std::chrono::milliseconds autosave_interval{std::chrono::minutes(5)};
    std::chrono::milliseconds finalize_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds key_watchdog{0}; // 0 disables
    bool partial_on_abort = false;
    AssemblerOptions assembler;
};

struct ControllerStatus {
    ControllerState state = ControllerState::Idle;
    std::string session_id;
    double elapsed_s = 0.0;
    size_t chunks = 0;
    size_t pending = 0;
    std::optional<std::chrono::system_clock::time_point> last_autosave_at;
};

// Drives Idle -> Recording -> Finalizing -> Idle for hold-to-record sessions.
//
// All state lives behind one mutex. Chunk transcription runs on the executor
// and each result is folded back in under the same mutex, keyed by session id
// so results from an earlier session are discarded. Timers are keyed the
// same way. The sink, the notice callback and the audio source are never
// called with the mutex held.
class SessionController {
public:
    using NoticeCallback = std::function<void(const Notice&)>;

    SessionController(ControllerOptions options, AudioChunkSource& source,
                      WhisperBackend& backend, Executor& executor, Scheduler& scheduler,
                      ResultSink& sink, CheckpointStore* checkpoints = nullptr,
                      NoticeCallback on_notice = {}, bool verbose = false);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Raw key input; combo edges are forwarded to on_combo().
    void on_key_event(LogicalKey key, KeyTransition transition);
    void on_combo(ComboEvent event);

    // Starts a session. Ignored (returns false) unless Idle.
    bool engage();
    // Same transition as releasing the combo.
    bool force_stop();
    // Drops the current session without assembling a transcript.
    bool discard();

    ControllerState state() const;
    ControllerStatus status() const;
    size_t sessions_started() const;

    bool wait_idle(std::chrono::milliseconds timeout);

    // Stops any recording and waits for its transcript. No new sessions afterwards.
    void shutdown();

private:
    enum class AbortCause { SourceError, Discard };

    bool stop_recording(const std::string& expected_id, StopReason reason);
    bool abort_session(const std::string& expected_id, const std::string& reason, AbortCause cause);

    void on_chunk(const std::string& id, AudioChunk chunk);
    void on_source_error(const std::string& id, std::string error);
    void on_fragment(const std::string& id, TranscriptFragment fragment);
    void on_finalize_timeout(const std::string& id);
    void on_autosave(const std::string& id);
    void on_watchdog(uint64_t generation);

    void dispatch_locked(const std::string& id, RecordingSession::ChunkPtr chunk);
    void arm_recording_timers_locked(const std::string& id);
    void cancel_timers_locked();
    AssembledTranscript complete_locked();
    void hand_off(AssembledTranscript transcript);
    void return_to_idle(const std::string& id);
    void emit_notice(Notice notice);

    void log(const std::string& msg) const;

    ControllerOptions options_;
    AudioChunkSource& source_;
    WhisperBackend& backend_;
    Executor& executor_;
    Scheduler& scheduler_;
    ResultSink& sink_;
    CheckpointStore* checkpoints_;
    NoticeCallback on_notice_;
    bool verbose_;
    TranscriptAssembler assembler_;

    mutable std::mutex mu_;
    std::condition_variable idle_cv_;
    ControllerState state_ = ControllerState::Idle;
    std::unique_ptr<RecordingSession> session_;
    KeyComboTracker tracker_;

    bool source_open_ = false;      // chunks for the current session are still accepted
    bool starting_ = false;         // source_.start() in progress
    bool source_stopping_ = false;  // stop_recording() is inside source_.stop()
    std::optional<StopReason> deferred_stop_;
    bool deferred_discard_ = false; // applied once start() or stop() returns
    bool max_stop_posted_ = false;
    bool closing_ = false;
    size_t sessions_started_ = 0;

    Scheduler::TimerId autosave_timer_ = Scheduler::kNoTimer;
    Scheduler::TimerId max_duration_timer_ = Scheduler::kNoTimer;
    Scheduler::TimerId finalize_timer_ = Scheduler::kNoTimer;
    Scheduler::TimerId watchdog_timer_ = Scheduler::kNoTimer;
    uint64_t watchdog_generation_ = 0;

    // Held across a checkpoint write and across checkpoint removal, so a slow
    // autosave can never recreate the checkpoint of a finished session.
    // Never acquired while mu_ is held.
    std::mutex checkpoint_mu_;
};
