#include "session/session_controller.hpp"

#include <format>
#include <print>

using namespace std::chrono_literals;

SessionController::SessionController(ControllerOptions options, AudioChunkSource& source,
                                     WhisperBackend& backend, Executor& executor,
                                     Scheduler& scheduler, ResultSink& sink,
                                     CheckpointStore* checkpoints, NoticeCallback on_notice,
                                     bool verbose)
    : options_(std::move(options)), source_(source), backend_(backend),
      executor_(executor), scheduler_(scheduler), sink_(sink),
      checkpoints_(checkpoints), on_notice_(std::move(on_notice)),
      verbose_(verbose), assembler_(options_.assembler) {}

SessionController::~SessionController() {
    bool stop_source = false;
    {
        std::lock_guard lock(mu_);
        closing_ = true;
        cancel_timers_locked();
        scheduler_.cancel(finalize_timer_);
        stop_source = source_open_;
        source_open_ = false;
    }
    // The checkpoint is kept so the session can be recovered on the next start.
    if (stop_source) source_.stop();
}

void SessionController::on_key_event(LogicalKey key, KeyTransition transition) {
    std::optional<ComboEvent> event;
    {
        std::lock_guard lock(mu_);
        event = tracker_.on_key_event(key, transition);

        if (options_.key_watchdog > 0ms) {
            scheduler_.cancel(watchdog_timer_);
            watchdog_timer_ = Scheduler::kNoTimer;
            if (tracker_.engaged()) {
                uint64_t gen = ++watchdog_generation_;
                watchdog_timer_ = scheduler_.schedule(options_.key_watchdog,
                                                      [this, gen] { on_watchdog(gen); });
            }
        }
    }

    if (event) {
        log(std::string("Combo ") + to_string(*event));
        on_combo(*event);
    }
}

void SessionController::on_combo(ComboEvent event) {
    switch (event) {
        case ComboEvent::Engaged:
            engage();
            break;
        case ComboEvent::Released:
            stop_recording({}, StopReason::Released);
            break;
    }
}

bool SessionController::engage() {
    std::string id;
    {
        std::lock_guard lock(mu_);
        if (closing_) return false;
        if (state_ != ControllerState::Idle) {
            log(std::format("Engage ignored while {}", to_string(state_)));
            return false;
        }

        session_ = std::make_unique<RecordingSession>(RecordingSession::make_id(),
                                                      RecordingSession::Clock::now());
        id = session_->id();
        state_ = ControllerState::Recording;
        source_open_ = true;
        starting_ = true;
        deferred_stop_.reset();
        deferred_discard_ = false;
        max_stop_posted_ = false;
        ++sessions_started_;
        arm_recording_timers_locked(id);
    }

    log("Recording started, session " + id);

    auto started = source_.start(
        options_.format,
        [this, id](AudioChunk chunk) { on_chunk(id, std::move(chunk)); },
        [this, id](std::string error) { on_source_error(id, std::move(error)); });

    std::optional<StopReason> stop;
    bool discard_now = false;
    {
        std::lock_guard lock(mu_);
        starting_ = false;
        if (!started) {
            source_open_ = false;
        } else {
            stop = deferred_stop_;
            discard_now = deferred_discard_;
        }
    }

    if (!started) {
        abort_session(id, "audio source failed to start: " + started.error(),
                      AbortCause::SourceError);
        return false;
    }

    if (discard_now) {
        abort_session(id, "discarded", AbortCause::Discard);
    } else if (stop) {
        stop_recording(id, *stop);
    }
    return true;
}

bool SessionController::force_stop() {
    return stop_recording({}, StopReason::ForceStop);
}

bool SessionController::discard() {
    {
        std::lock_guard lock(mu_);
        if (starting_) {
            deferred_discard_ = true;
            return true;
        }
    }
    return abort_session({}, "discarded", AbortCause::Discard);
}

bool SessionController::stop_recording(const std::string& expected_id, StopReason reason) {
    std::string id;
    {
        std::lock_guard lock(mu_);
        if (state_ != ControllerState::Recording || !session_) return false;
        if (!expected_id.empty() && session_->id() != expected_id) return false;
        if (starting_) {
            deferred_stop_ = reason;
            return true;
        }

        id = session_->id();
        state_ = ControllerState::Finalizing;
        session_->begin_finalizing();
        cancel_timers_locked();
        source_stopping_ = true;
        deferred_discard_ = false;

        // A stuck recording usually means a key release was never observed.
        if (reason == StopReason::MaxDuration) tracker_.reset();
    }

    log(std::format("Recording stopped ({}), session {}", to_string(reason), id));
    if (reason == StopReason::MaxDuration) {
        emit_notice({Notice::Kind::MaxDuration, id, "session force-stopped: max duration"});
    }

    // The final short chunk is delivered through on_chunk() before this returns.
    // Discards arriving meanwhile are deferred, so the session cannot return to
    // Idle and start the source again while it is still being torn down.
    source_.stop();

    std::optional<AssembledTranscript> done;
    bool discard_now = false;
    {
        std::lock_guard lock(mu_);
        source_stopping_ = false;
        source_open_ = false;
        discard_now = deferred_discard_;
        deferred_discard_ = false;
        if (!session_ || session_->id() != id) return true;

        if (!discard_now && session_->pending() == 0) {
            done = complete_locked();
        } else if (!discard_now) {
            log(std::format("Waiting for {} transcription(s)", session_->pending()));
            finalize_timer_ = scheduler_.schedule(options_.finalize_timeout,
                                                  [this, id] { on_finalize_timeout(id); });
        }
    }

    if (discard_now) {
        abort_session(id, "discarded", AbortCause::Discard);
    } else if (done) {
        hand_off(std::move(*done));
    }
    return true;
}

bool SessionController::abort_session(const std::string& expected_id, const std::string& reason,
                                      AbortCause cause) {
    std::string id;
    bool stop_source = false;
    std::optional<AssembledTranscript> partial;
    {
        std::lock_guard lock(mu_);
        if (!session_) return false;
        if (!expected_id.empty() && session_->id() != expected_id) return false;
        // Once Finalizing has begun all audio is captured; a late source error changes nothing.
        if (cause == AbortCause::SourceError && session_->status() != SessionStatus::Active) {
            log("Ignoring source error, session " + session_->id() + " is no longer recording");
            return false;
        }
        if (source_stopping_) {
            deferred_discard_ = true;
            return true;
        }
        if (!session_->abort()) return false;

        id = session_->id();
        cancel_timers_locked();
        scheduler_.cancel(finalize_timer_);
        finalize_timer_ = Scheduler::kNoTimer;
        stop_source = source_open_;
        source_open_ = false;

        if (cause == AbortCause::SourceError && options_.partial_on_abort) {
            partial = assembler_.assemble(id, session_->fragments(), session_->chunk_infos());
            partial->incomplete = true;
        }
        session_->release_audio();
        state_ = ControllerState::Finalizing;
    }

    // Chunks flushed by this stop arrive with source_open_ false and are dropped.
    if (stop_source) source_.stop();

    if (cause == AbortCause::SourceError) {
        std::println(stderr, "session {}: aborted: {}", id, reason);
        emit_notice({Notice::Kind::Aborted, id, "recording aborted: " + reason});
    } else {
        log("Session " + id + " discarded");
    }

    if (partial) {
        log(std::format("Delivering partial transcript ({} of {} chunks)",
                        partial->chunk_count - partial->missing_count, partial->chunk_count));
        sink_.deliver(*partial);
    }

    if (checkpoints_) {
        std::lock_guard lock(checkpoint_mu_);
        checkpoints_->remove(id);
    }
    return_to_idle(id);
    return true;
}

void SessionController::on_chunk(const std::string& id, AudioChunk chunk) {
    std::lock_guard lock(mu_);
    if (!session_ || session_->id() != id || !source_open_) {
        log(std::format("Dropping chunk {} for inactive session {}", chunk.sequence, id));
        return;
    }
    if (chunk.samples.empty()) return;

    auto appended = session_->append(std::move(chunk));
    if (!appended) {
        std::println(stderr, "session {}: rejected chunk: {}", id, appended.error());
        return;
    }
    log(std::format("Chunk {} ({:.1f}s{})", (*appended)->sequence, (*appended)->duration_s,
                    (*appended)->is_final ? ", final" : ""));
    dispatch_locked(id, *appended);

    // Catches the cutoff within one chunk even if the timer is late.
    double max_s = std::chrono::duration<double>(options_.max_duration).count();
    if (state_ == ControllerState::Recording && !max_stop_posted_ && session_->elapsed() >= max_s) {
        max_stop_posted_ = true;
        scheduler_.schedule(0ms, [this, id] { stop_recording(id, StopReason::MaxDuration); });
    }
}

void SessionController::on_source_error(const std::string& id, std::string error) {
    // Runs on the source's thread, which abort_session() would have to join.
    scheduler_.schedule(0ms, [this, id, error = std::move(error)] {
        abort_session(id, "audio source failed: " + error, AbortCause::SourceError);
    });
}

void SessionController::dispatch_locked(const std::string& id, RecordingSession::ChunkPtr chunk) {
    executor_.post([this, id, chunk = std::move(chunk)] {
        auto result = backend_.transcribe(chunk->samples, chunk->sample_rate, chunk->channels);
        if (!result) {
            std::println(stderr, "transcribe: session {} chunk {} failed: {}",
                         id, chunk->sequence, result.error());
        }
        on_fragment(id, make_fragment(*chunk, result));
    });
}

void SessionController::on_fragment(const std::string& id, TranscriptFragment fragment) {
    std::optional<AssembledTranscript> done;
    {
        std::lock_guard lock(mu_);
        if (!session_ || session_->id() != id) {
            log(std::format("Discarding late fragment {} of session {}", fragment.sequence, id));
            return;
        }
        auto status = session_->status();
        if (status != SessionStatus::Active && status != SessionStatus::Finalizing) return;

        uint32_t seq = fragment.sequence;
        if (!session_->record_fragment(std::move(fragment))) {
            log(std::format("Ignoring duplicate or unknown fragment {}", seq));
            return;
        }

        if (status == SessionStatus::Finalizing && !source_open_ && session_->pending() == 0) {
            done = complete_locked();
        }
    }

    if (done) hand_off(std::move(*done));
}

void SessionController::on_finalize_timeout(const std::string& id) {
    std::optional<AssembledTranscript> done;
    {
        std::lock_guard lock(mu_);
        if (!session_ || session_->id() != id) return;
        if (session_->status() != SessionStatus::Finalizing || source_open_) return;

        std::println(stderr, "session {}: finalization timed out with {} transcription(s) outstanding",
                     id, session_->pending());
        finalize_timer_ = Scheduler::kNoTimer;
        done = complete_locked();
    }

    hand_off(std::move(*done));
}

void SessionController::on_autosave(const std::string& id) {
    std::lock_guard save_lock(checkpoint_mu_);

    Checkpoint cp;
    {
        std::lock_guard lock(mu_);
        if (!session_ || session_->id() != id || state_ != ControllerState::Recording) return;

        auto now = RecordingSession::Clock::now();
        cp.session_id = id;
        cp.started_at = std::chrono::duration_cast<std::chrono::seconds>(
            session_->started_at().time_since_epoch()).count();
        cp.saved_at = std::chrono::duration_cast<std::chrono::seconds>(
            now.time_since_epoch()).count();
        cp.chunks = session_->chunks();
        for (const auto& [seq, frag] : session_->fragments()) {
            cp.fragments.push_back(frag);
        }

        autosave_timer_ = scheduler_.schedule(options_.autosave_interval,
                                              [this, id] { on_autosave(id); });
    }

    auto saved = checkpoints_->save(cp);

    std::lock_guard lock(mu_);
    if (!saved) {
        std::println(stderr, "autosave: session {} failed: {} (retrying next tick)",
                     id, saved.error());
        return;
    }
    if (session_ && session_->id() == id) {
        session_->mark_autosaved(RecordingSession::Clock::now());
        log(std::format("Autosaved {} chunk(s), {} fragment(s)",
                        cp.chunks.size(), cp.fragments.size()));
    }
}

void SessionController::on_watchdog(uint64_t generation) {
    std::string id;
    {
        std::lock_guard lock(mu_);
        if (generation != watchdog_generation_ || !tracker_.engaged()) return;

        std::println(stderr, "hotkey: no key activity for {}s with the combo held, assuming a missed release",
                     std::chrono::duration_cast<std::chrono::seconds>(options_.key_watchdog).count());
        tracker_.reset();
        watchdog_timer_ = Scheduler::kNoTimer;
        if (state_ == ControllerState::Recording && session_) id = session_->id();
    }

    if (!id.empty()) stop_recording(id, StopReason::Released);
}

void SessionController::arm_recording_timers_locked(const std::string& id) {
    max_duration_timer_ = scheduler_.schedule(options_.max_duration, [this, id] {
        stop_recording(id, StopReason::MaxDuration);
    });

    if (checkpoints_ && options_.autosave_interval > 0ms) {
        autosave_timer_ = scheduler_.schedule(options_.autosave_interval,
                                              [this, id] { on_autosave(id); });
    }
}

void SessionController::cancel_timers_locked() {
    scheduler_.cancel(autosave_timer_);
    scheduler_.cancel(max_duration_timer_);
    autosave_timer_ = Scheduler::kNoTimer;
    max_duration_timer_ = Scheduler::kNoTimer;
}

AssembledTranscript SessionController::complete_locked() {
    scheduler_.cancel(finalize_timer_);
    finalize_timer_ = Scheduler::kNoTimer;

    session_->finalize();
    auto transcript = assembler_.assemble(session_->id(), session_->fragments(),
                                          session_->chunk_infos());
    session_->release_audio();
    return transcript;
}

void SessionController::hand_off(AssembledTranscript transcript) {
    log(std::format("Session {} finalized: {} chunk(s), {:.1f}s, confidence {:.2f}{}",
                    transcript.session_id, transcript.chunk_count, transcript.duration_s,
                    transcript.confidence, transcript.incomplete ? ", incomplete" : ""));

    sink_.deliver(transcript);

    if (checkpoints_) {
        std::lock_guard lock(checkpoint_mu_);
        checkpoints_->remove(transcript.session_id);
    }
    return_to_idle(transcript.session_id);
}

void SessionController::return_to_idle(const std::string& id) {
    {
        std::lock_guard lock(mu_);
        if (!session_ || session_->id() != id) return;
        session_.reset();
        state_ = ControllerState::Idle;
    }
    idle_cv_.notify_all();
}

void SessionController::emit_notice(Notice notice) {
    if (on_notice_) on_notice_(notice);
}

ControllerState SessionController::state() const {
    std::lock_guard lock(mu_);
    return state_;
}

ControllerStatus SessionController::status() const {
    std::lock_guard lock(mu_);
    ControllerStatus st{.state = state_};
    if (session_) {
        st.session_id = session_->id();
        st.elapsed_s = session_->elapsed();
        st.chunks = session_->chunks().size();
        st.pending = session_->pending();
        st.last_autosave_at = session_->last_autosave_at();
    }
    return st;
}

size_t SessionController::sessions_started() const {
    std::lock_guard lock(mu_);
    return sessions_started_;
}

bool SessionController::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mu_);
    return idle_cv_.wait_for(lock, timeout, [this] { return state_ == ControllerState::Idle; });
}

void SessionController::shutdown() {
    force_stop();
    if (!wait_idle(options_.finalize_timeout + 5s)) {
        std::println(stderr, "session: shutdown timed out waiting for finalization");
    }
    std::lock_guard lock(mu_);
    closing_ = true;
}

void SessionController::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[holdscribe] {}", msg);
    }
}

const char* to_string(ControllerState state) {
    switch (state) {
        case ControllerState::Idle:       return "idle";
        case ControllerState::Recording:  return "recording";
        case ControllerState::Finalizing: return "finalizing";
    }
    return "unknown";
}

const char* to_string(StopReason reason) {
    switch (reason) {
        case StopReason::Released:    return "released";
        case StopReason::ForceStop:   return "force stop";
        case StopReason::MaxDuration: return "max duration";
    }
    return "unknown";
}
