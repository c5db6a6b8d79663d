#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "session/session_controller.hpp"
#include "test_doubles.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <vector>

using namespace std::chrono_literals;

namespace {

ControllerOptions default_options() {
    ControllerOptions o;
    o.format = ChunkFormat{.chunk_seconds = 30.0, .sample_rate = 16000, .channels = 1};
    o.max_duration = 1h;
    o.autosave_interval = 5min;
    o.finalize_timeout = 30s;
    return o;
}

struct Harness {
    explicit Harness(ControllerOptions options = default_options())
        : controller(std::move(options), source, backend, executor, scheduler, sink, &store,
                     [this](const Notice& n) { notices.push_back(n); }) {}

    bool saw_notice(Notice::Kind kind) const {
        return std::ranges::any_of(notices, [kind](const Notice& n) { return n.kind == kind; });
    }

    void press() {
        controller.on_key_event(LogicalKey::ModifierLeft, KeyTransition::Down);
        controller.on_key_event(LogicalKey::Letter, KeyTransition::Down);
    }

    void release() {
        controller.on_key_event(LogicalKey::Letter, KeyTransition::Up);
        controller.on_key_event(LogicalKey::ModifierLeft, KeyTransition::Up);
    }

    MockChunkSource source;
    ScriptedBackend backend;
    ManualExecutor executor;
    ManualScheduler scheduler;
    RecordingSink sink;
    MemoryCheckpointStore store;
    std::vector<Notice> notices;
    SessionController controller;
};

} // namespace

TEST_CASE("SessionController lifecycle", "[controller]") {
    Harness h;

    SECTION("InitialState") {
        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(h.controller.status().session_id.empty());
        REQUIRE(h.controller.sessions_started() == 0);
    }

    SECTION("WeightedTranscriptFromShuffledCompletions") {
        h.backend.set(0, "one", 0.9);
        h.backend.set(1, "two", 0.8);
        h.backend.set(2, "three", 0.95);
        h.backend.set(3, "four", 0.5);
        h.source.final_seconds = 5.0;

        h.press();
        REQUIRE(h.controller.state() == ControllerState::Recording);
        REQUIRE(h.source.starts == 1);

        h.source.emit_full();
        h.source.emit_full();
        h.source.emit_full();
        REQUIRE(h.executor.size() == 3);
        REQUIRE(h.controller.status().elapsed_s == Catch::Approx(90.0));

        h.release();
        REQUIRE(h.controller.state() == ControllerState::Finalizing);
        REQUIRE(h.source.stops == 1);
        REQUIRE(h.executor.size() == 4);
        REQUIRE(h.controller.status().pending == 4);

        h.executor.run(3); // chunk 3
        h.executor.run(0); // chunk 0
        h.executor.run(1); // chunk 2
        REQUIRE(h.sink.count() == 0);
        h.executor.run(0); // chunk 1

        REQUIRE(h.sink.count() == 1);
        const auto& t = h.sink.delivered[0];
        REQUIRE(t.full_text == "one two three four");
        REQUIRE(t.confidence == Catch::Approx(82.0 / 95.0));
        REQUIRE(t.duration_s == Catch::Approx(95.0));
        REQUIRE(t.chunk_count == 4);
        REQUIRE_FALSE(t.incomplete);
        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(h.scheduler.pending() == 0);
    }

    SECTION("FragmentsDoneBeforeReleaseFinishImmediately") {
        h.controller.engage();
        h.source.emit_full();
        h.executor.run_all();

        REQUIRE(h.controller.force_stop());
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.sink.delivered[0].full_text == "chunk0");
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }

    SECTION("ReleaseWithoutAudioDeliversEmptyTranscript") {
        h.controller.engage();
        h.controller.force_stop();
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.sink.delivered[0].chunk_count == 0);
        REQUIRE(h.sink.delivered[0].full_text.empty());
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }

    SECTION("EngageWhileRecordingIsIgnored") {
        REQUIRE(h.controller.engage());
        auto id = h.controller.status().session_id;
        REQUIRE_FALSE(h.controller.engage());
        REQUIRE(h.controller.sessions_started() == 1);
        REQUIRE(h.source.starts == 1);
        REQUIRE(h.controller.status().session_id == id);
    }

    SECTION("EngageWhileFinalizingIsDropped") {
        h.controller.engage();
        h.source.emit_full();
        h.controller.force_stop();
        REQUIRE(h.controller.state() == ControllerState::Finalizing);

        h.press();
        REQUIRE(h.controller.state() == ControllerState::Finalizing);
        REQUIRE(h.controller.sessions_started() == 1);

        h.executor.run_all();
        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(h.sink.count() == 1);
    }

    SECTION("StopWhenIdleDoesNothing") {
        REQUIRE_FALSE(h.controller.force_stop());
        REQUIRE_FALSE(h.controller.discard());
        REQUIRE(h.source.stops == 0);
        REQUIRE(h.sink.count() == 0);
    }

    SECTION("BackendFailureLowersConfidence") {
        h.backend.fail(1, "server unreachable");
        h.controller.engage();
        h.source.emit_full();
        h.source.emit_full();
        h.controller.force_stop();
        h.executor.run_all();

        REQUIRE(h.sink.count() == 1);
        const auto& t = h.sink.delivered[0];
        REQUIRE(t.full_text == "chunk0");
        REQUIRE(t.confidence == Catch::Approx(0.5));
        REQUIRE_FALSE(t.incomplete);
    }

    SECTION("SessionsHaveDistinctIds") {
        h.controller.engage();
        auto first = h.controller.status().session_id;
        h.controller.force_stop();
        h.controller.engage();
        auto second = h.controller.status().session_id;
        h.controller.force_stop();

        REQUIRE(h.sink.count() == 2);
        REQUIRE(first != second);
        REQUIRE(h.sink.delivered[0].session_id == first);
        REQUIRE(h.sink.delivered[1].session_id == second);
    }
}

TEST_CASE("SessionController assembles in sequence order for every completion order",
          "[controller]") {
    std::vector<uint32_t> order = {0, 1, 2, 3};
    int orderings = 0;
    do {
        Harness h;
        h.backend.set(0, "one", 0.9);
        h.backend.set(1, "two", 0.8);
        h.backend.set(2, "three", 0.95);
        h.backend.set(3, "four", 0.5);
        h.source.final_seconds = 5.0;

        h.press();
        h.source.emit_full();
        h.source.emit_full();
        h.source.emit_full();
        h.release();
        REQUIRE(h.executor.size() == 4);

        // Tasks were queued in sequence order; run them in this ordering.
        std::vector<uint32_t> queued = {0, 1, 2, 3};
        for (uint32_t seq : order) {
            auto it = std::ranges::find(queued, seq);
            h.executor.run(static_cast<size_t>(it - queued.begin()));
            queued.erase(it);
        }

        INFO("completion order " << order[0] << order[1] << order[2] << order[3]);
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.sink.delivered[0].full_text == "one two three four");
        REQUIRE(h.sink.delivered[0].confidence == Catch::Approx(82.0 / 95.0));
        REQUIRE(h.controller.state() == ControllerState::Idle);
        ++orderings;
    } while (std::next_permutation(order.begin(), order.end()));

    REQUIRE(orderings == 24);
}

TEST_CASE("SessionController finalization timeout", "[controller]") {
    Harness h;
    h.source.final_seconds = 10.0;

    SECTION("LostTranscriptionStillFinalizes") {
        h.controller.engage();
        h.controller.force_stop();
        REQUIRE(h.controller.state() == ControllerState::Finalizing);

        h.executor.drop_all();
        h.scheduler.advance(29s);
        REQUIRE(h.sink.count() == 0);
        h.scheduler.advance(1s);

        REQUIRE(h.sink.count() == 1);
        const auto& t = h.sink.delivered[0];
        REQUIRE(t.full_text.empty());
        REQUIRE(t.confidence == 0.0);
        REQUIRE(t.missing_count == 1);
        REQUIRE(t.incomplete);
        REQUIRE(t.duration_s == Catch::Approx(10.0));
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }

    SECTION("LateResultIsDiscarded") {
        h.controller.engage();
        h.controller.force_stop();
        h.scheduler.advance(30s);
        REQUIRE(h.sink.count() == 1);

        h.executor.run_all();
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }

    SECTION("LateResultDoesNotLeakIntoNextSession") {
        h.backend.set(0, "stale", 1.0);
        h.controller.engage();
        h.controller.force_stop();
        h.scheduler.advance(30s);

        h.source.final_seconds = 0.0;
        h.controller.engage();
        h.source.emit_full();
        REQUIRE(h.executor.size() == 2);

        // Old session's transcription returns into the new session.
        h.executor.run(0);
        REQUIRE(h.controller.status().pending == 1);

        h.backend.set(0, "fresh", 1.0);
        h.executor.run(0);
        h.controller.force_stop();

        REQUIRE(h.sink.count() == 2);
        REQUIRE(h.sink.delivered[1].full_text == "fresh");
    }
}

TEST_CASE("SessionController aborts", "[controller]") {
    SECTION("SourceErrorAbortsSession") {
        Harness h;
        h.controller.engage();
        auto id = h.controller.status().session_id;
        h.source.emit_full();

        h.source.fail("device removed");
        REQUIRE(h.controller.state() == ControllerState::Recording);
        h.scheduler.run_due();

        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(h.saw_notice(Notice::Kind::Aborted));
        REQUIRE(h.notices.back().session_id == id);
        REQUIRE(h.source.stops == 1);
        REQUIRE(h.sink.count() == 0);
        REQUIRE(std::ranges::find(h.store.removed, id) != h.store.removed.end());

        // The in-flight transcription finishes into nothing.
        h.executor.run_all();
        REQUIRE(h.sink.count() == 0);
    }

    SECTION("SourceErrorDeliversPartialWhenEnabled") {
        auto options = default_options();
        options.partial_on_abort = true;
        Harness h(options);

        h.controller.engage();
        h.source.emit_full();
        h.source.emit_full();
        h.executor.run(0);

        h.source.fail("device removed");
        h.scheduler.run_due();

        REQUIRE(h.sink.count() == 1);
        const auto& t = h.sink.delivered[0];
        REQUIRE(t.full_text == "chunk0");
        REQUIRE(t.incomplete);
        REQUIRE(t.missing_count == 1);
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }

    SECTION("StartFailureReturnsToIdle") {
        Harness h;
        h.source.start_error = "no such device";

        REQUIRE_FALSE(h.controller.engage());
        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(h.saw_notice(Notice::Kind::Aborted));
        REQUIRE(h.sink.count() == 0);
        REQUIRE(h.scheduler.pending() == 0);

        h.source.start_error.reset();
        REQUIRE(h.controller.engage());
        REQUIRE(h.controller.state() == ControllerState::Recording);
    }

    SECTION("DiscardDropsEverything") {
        Harness h;
        h.source.final_seconds = 3.0;
        h.controller.engage();
        auto id = h.controller.status().session_id;
        h.source.emit_full();

        REQUIRE(h.controller.discard());
        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(h.notices.empty());
        REQUIRE(std::ranges::find(h.store.removed, id) != h.store.removed.end());

        // The flushed final chunk is not transcribed.
        REQUIRE(h.executor.size() == 1);
        h.executor.run_all();
        REQUIRE(h.sink.count() == 0);
        REQUIRE(h.scheduler.pending() == 0);
    }

    SECTION("DiscardWhileFinalizing") {
        Harness h;
        h.controller.engage();
        h.source.emit_full();
        h.controller.force_stop();
        REQUIRE(h.controller.state() == ControllerState::Finalizing);

        REQUIRE(h.controller.discard());
        REQUIRE(h.controller.state() == ControllerState::Idle);
        h.executor.run_all();
        h.scheduler.advance(1min);
        REQUIRE(h.sink.count() == 0);
    }
}

TEST_CASE("SessionController max duration", "[controller]") {
    auto options = default_options();
    options.max_duration = 60s;
    Harness h(options);

    SECTION("ChunkCountStopsAtLimit") {
        h.press();
        h.source.emit_full();
        h.source.emit_full();
        REQUIRE(h.controller.state() == ControllerState::Recording);

        h.scheduler.run_due();
        REQUIRE(h.controller.state() == ControllerState::Finalizing);
        REQUIRE(h.saw_notice(Notice::Kind::MaxDuration));

        // The held keys were forgotten, so releasing them does nothing.
        h.release();
        REQUIRE(h.controller.state() == ControllerState::Finalizing);

        h.executor.run_all();
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(h.controller.sessions_started() == 1);

        // A fresh press starts a new session.
        h.press();
        REQUIRE(h.controller.sessions_started() == 2);
    }

    SECTION("TimerStopsAtLimit") {
        h.controller.engage();
        h.scheduler.advance(59s);
        REQUIRE(h.controller.state() == ControllerState::Recording);
        h.scheduler.advance(1s);

        REQUIRE(h.saw_notice(Notice::Kind::MaxDuration));
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }

    SECTION("TimerOfEarlierSessionIsCancelled") {
        h.controller.engage();
        h.scheduler.advance(10s);
        h.controller.force_stop();

        h.scheduler.advance(10s);
        h.controller.engage();
        h.scheduler.advance(45s);
        REQUIRE(h.controller.state() == ControllerState::Recording);
        REQUIRE_FALSE(h.saw_notice(Notice::Kind::MaxDuration));
    }
}

TEST_CASE("SessionController autosave", "[controller]") {
    Harness h;

    SECTION("SavesChunksAndFragments") {
        h.controller.engage();
        auto id = h.controller.status().session_id;
        h.source.emit_full();
        h.source.emit_full();
        h.executor.run(0);

        h.scheduler.advance(5min);
        REQUIRE(h.store.saved.count(id) == 1);
        const auto& cp = h.store.saved.at(id);
        REQUIRE(cp.chunks.size() == 2);
        REQUIRE(cp.fragments.size() == 1);
        REQUIRE(cp.fragments[0].sequence == 0);
        REQUIRE(h.controller.status().last_autosave_at.has_value());

        // Removed once the transcript is handed off.
        h.controller.force_stop();
        h.executor.run_all();
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.store.saved.empty());
    }

    SECTION("RetriesAfterFailure") {
        h.store.failures_left = 1;
        h.controller.engage();
        auto id = h.controller.status().session_id;
        h.source.emit_full();

        h.scheduler.advance(5min);
        REQUIRE(h.store.save_attempts == 1);
        REQUIRE(h.store.saved.empty());
        REQUIRE(h.controller.state() == ControllerState::Recording);
        REQUIRE_FALSE(h.controller.status().last_autosave_at.has_value());

        h.scheduler.advance(5min);
        REQUIRE(h.store.save_attempts == 2);
        REQUIRE(h.store.saved.count(id) == 1);
    }

    SECTION("NoAutosaveAfterStop") {
        h.controller.engage();
        h.source.emit_full();
        h.controller.force_stop();
        h.scheduler.advance(10min);
        REQUIRE(h.store.save_attempts == 0);
    }
}

TEST_CASE("SessionController start races", "[controller]") {
    Harness h;

    SECTION("StopDuringStartIsDeferred") {
        h.source.on_started = [&h] { REQUIRE(h.controller.force_stop()); };
        REQUIRE(h.controller.engage());
        REQUIRE(h.source.stops == 1);
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }

    SECTION("DiscardDuringStartIsDeferred") {
        h.source.on_started = [&h] { REQUIRE(h.controller.discard()); };
        REQUIRE(h.controller.engage());
        REQUIRE(h.source.stops == 1);
        REQUIRE(h.sink.count() == 0);
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }
}

TEST_CASE("SessionController stop races", "[controller]") {
    Harness h;
    h.source.final_seconds = 3.0;

    SECTION("DiscardDuringStopIsDeferred") {
        h.controller.engage();
        auto id = h.controller.status().session_id;
        h.source.emit_full();

        h.source.on_stopping = [&h] {
            REQUIRE(h.controller.discard());
            REQUIRE(h.controller.state() == ControllerState::Finalizing);
            REQUIRE_FALSE(h.controller.engage());
        };
        REQUIRE(h.controller.force_stop());

        REQUIRE(h.source.stops == 1);
        REQUIRE(h.source.starts == 1);
        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(std::ranges::find(h.store.removed, id) != h.store.removed.end());
        h.executor.run_all();
        h.scheduler.advance(1min);
        REQUIRE(h.sink.count() == 0);

        h.source.on_stopping = nullptr;
        REQUIRE(h.controller.engage());
        REQUIRE(h.source.starts == 2);
    }

    SECTION("SourceErrorAfterReleaseIsIgnored") {
        h.backend.set(0, "kept", 1.0);
        h.controller.engage();
        h.source.emit_full();
        h.source.fail("device removed");
        REQUIRE(h.controller.force_stop());
        REQUIRE(h.controller.state() == ControllerState::Finalizing);

        h.scheduler.run_due();
        REQUIRE(h.controller.state() == ControllerState::Finalizing);
        REQUIRE_FALSE(h.saw_notice(Notice::Kind::Aborted));

        h.executor.run_all();
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.sink.delivered[0].full_text == "kept chunk1");
        REQUIRE_FALSE(h.sink.delivered[0].incomplete);
        REQUIRE(h.source.stops == 1);
    }

    SECTION("SourceErrorDuringStopIsIgnored") {
        h.controller.engage();
        h.source.emit_full();
        h.source.on_stopping = [&h] {
            h.source.fail("stream error");
            h.scheduler.run_due();
        };
        REQUIRE(h.controller.force_stop());

        REQUIRE(h.source.stops == 1);
        REQUIRE_FALSE(h.saw_notice(Notice::Kind::Aborted));
        h.executor.run_all();
        REQUIRE(h.sink.count() == 1);
        REQUIRE(h.sink.delivered[0].full_text == "chunk0 chunk1");
        REQUIRE(h.controller.state() == ControllerState::Idle);
    }
}

TEST_CASE("SessionController key watchdog", "[controller]") {
    auto options = default_options();
    options.key_watchdog = 10s;
    Harness h(options);

    SECTION("MissedReleaseStopsSession") {
        h.press();
        h.scheduler.advance(9s);
        REQUIRE(h.controller.state() == ControllerState::Recording);

        h.scheduler.advance(1s);
        REQUIRE(h.controller.state() == ControllerState::Idle);
        REQUIRE(h.sink.count() == 1);

        // Keys are considered released, so the next press engages again.
        h.press();
        REQUIRE(h.controller.sessions_started() == 2);
    }

    SECTION("AutorepeatKeepsSessionAlive") {
        h.press();
        for (int i = 0; i < 5; ++i) {
            h.scheduler.advance(5s);
            h.controller.on_key_event(LogicalKey::Letter, KeyTransition::Down);
        }
        REQUIRE(h.controller.state() == ControllerState::Recording);

        h.release();
        REQUIRE(h.controller.state() == ControllerState::Idle);
        h.scheduler.advance(1min);
        REQUIRE(h.controller.sessions_started() == 1);
    }
}

TEST_CASE("SessionController names", "[controller]") {
    REQUIRE(std::string(to_string(ControllerState::Idle)) == "idle");
    REQUIRE(std::string(to_string(ControllerState::Recording)) == "recording");
    REQUIRE(std::string(to_string(ControllerState::Finalizing)) == "finalizing");
    REQUIRE(std::string(to_string(StopReason::MaxDuration)) == "max duration");
}
