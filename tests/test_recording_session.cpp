#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "session/recording_session.hpp"

#include <regex>
#include <set>
#include <string>

namespace {

AudioChunk chunk(uint32_t seq, double seconds) {
    return AudioChunk{
        .sequence = seq,
        .samples = std::vector<int16_t>(4, static_cast<int16_t>(seq)),
        .duration_s = seconds,
    };
}

TranscriptFragment fragment(uint32_t seq, std::string text) {
    return TranscriptFragment{.sequence = seq, .text = std::move(text), .confidence = 1.0};
}

} // namespace

TEST_CASE("RecordingSession", "[session]") {
    RecordingSession session("s1", RecordingSession::Clock::now());

    SECTION("InitialState") {
        REQUIRE(session.id() == "s1");
        REQUIRE(session.status() == SessionStatus::Active);
        REQUIRE(session.chunks().empty());
        REQUIRE(session.pending() == 0);
        REQUIRE(session.elapsed() == 0.0);
        REQUIRE_FALSE(session.last_autosave_at().has_value());
    }

    SECTION("AppendTracksElapsedAndPending") {
        REQUIRE(session.append(chunk(0, 30)).has_value());
        REQUIRE(session.append(chunk(1, 30)).has_value());
        REQUIRE(session.elapsed() == Catch::Approx(60.0));
        REQUIRE(session.pending() == 2);

        REQUIRE(session.record_fragment(fragment(1, "b")));
        REQUIRE(session.pending() == 1);

        auto infos = session.chunk_infos();
        REQUIRE(infos.size() == 2);
        REQUIRE(infos[1].sequence == 1);
        REQUIRE(infos[1].duration_s == Catch::Approx(30.0));
    }

    SECTION("SequenceMustIncrease") {
        REQUIRE(session.append(chunk(0, 1)).has_value());
        REQUIRE(session.append(chunk(2, 1)).has_value());
        REQUIRE_FALSE(session.append(chunk(2, 1)).has_value());
        REQUIRE_FALSE(session.append(chunk(1, 1)).has_value());
        REQUIRE(session.chunks().size() == 2);
        REQUIRE(session.elapsed() == Catch::Approx(2.0));
    }

    SECTION("FragmentForUnknownChunkRejected") {
        REQUIRE_FALSE(session.record_fragment(fragment(0, "a")));
        session.append(chunk(0, 1));
        REQUIRE(session.record_fragment(fragment(0, "a")));
        // the first result wins
        REQUIRE_FALSE(session.record_fragment(fragment(0, "again")));
        REQUIRE(session.fragments().at(0).text == "a");
    }

    SECTION("FinalizingStillAcceptsChunks") {
        REQUIRE(session.begin_finalizing());
        REQUIRE(session.status() == SessionStatus::Finalizing);
        REQUIRE(session.append(chunk(0, 5)).has_value());
        REQUIRE_FALSE(session.begin_finalizing());
    }

    SECTION("Lifecycle") {
        REQUIRE_FALSE(session.finalize());
        REQUIRE(session.begin_finalizing());
        REQUIRE(session.finalize());
        REQUIRE(session.status() == SessionStatus::Finalized);

        REQUIRE_FALSE(session.append(chunk(0, 1)).has_value());
        REQUIRE_FALSE(session.abort());
        REQUIRE(session.status() == SessionStatus::Finalized);
    }

    SECTION("AbortFromActive") {
        REQUIRE(session.abort());
        REQUIRE(session.status() == SessionStatus::Aborted);
        REQUIRE_FALSE(session.abort());
        REQUIRE_FALSE(session.begin_finalizing());
        REQUIRE_FALSE(session.append(chunk(0, 1)).has_value());
    }

    SECTION("AbortFromFinalizing") {
        session.begin_finalizing();
        REQUIRE(session.abort());
        REQUIRE_FALSE(session.finalize());
    }

    SECTION("ReleaseAudioKeepsFragments") {
        session.append(chunk(0, 1));
        session.record_fragment(fragment(0, "kept"));
        session.release_audio();
        REQUIRE(session.chunks().empty());
        REQUIRE(session.fragments().size() == 1);
        REQUIRE(session.pending() == 0);
    }

    SECTION("AutosaveMark") {
        auto at = RecordingSession::Clock::now();
        session.mark_autosaved(at);
        REQUIRE(session.last_autosave_at() == at);
    }
}

TEST_CASE("RecordingSession ids", "[session]") {
    SECTION("Format") {
        auto id = RecordingSession::make_id();
        REQUIRE(std::regex_match(id, std::regex(R"(\d{8}_\d{6}_[0-9a-f]{6})")));
    }

    SECTION("Unique") {
        auto at = RecordingSession::Clock::now();
        std::set<std::string> ids;
        for (int i = 0; i < 50; ++i) ids.insert(RecordingSession::make_id(at));
        REQUIRE(ids.size() > 45);
    }

    SECTION("StatusNames") {
        REQUIRE(std::string(to_string(SessionStatus::Active)) == "active");
        REQUIRE(std::string(to_string(SessionStatus::Aborted)) == "aborted");
    }
}
