#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "session/transcript_assembler.hpp"

#include <map>
#include <string>
#include <vector>

namespace {

TranscriptFragment fragment(uint32_t seq, std::string text, double confidence, double duration) {
    return TranscriptFragment{
        .sequence = seq,
        .text = std::move(text),
        .confidence = confidence,
        .duration_s = duration,
    };
}

std::map<uint32_t, TranscriptFragment> by_sequence(std::vector<TranscriptFragment> frags) {
    std::map<uint32_t, TranscriptFragment> out;
    for (auto& f : frags) out.emplace(f.sequence, std::move(f));
    return out;
}

} // namespace

TEST_CASE("TranscriptAssembler", "[assembler]") {
    TranscriptAssembler assembler;

    SECTION("DurationWeightedConfidence") {
        auto frags = by_sequence({
            fragment(0, "one", 0.9, 30),
            fragment(1, "two", 0.8, 30),
            fragment(2, "three", 0.95, 30),
            fragment(3, "four", 0.5, 5),
        });
        std::vector<ChunkInfo> expected{{0, 30}, {1, 30}, {2, 30}, {3, 5}};

        auto t = assembler.assemble("s1", frags, expected);
        REQUIRE(t.session_id == "s1");
        REQUIRE(t.full_text == "one two three four");
        // (27 + 24 + 28.5 + 2.5) / 95
        REQUIRE(t.confidence == Catch::Approx(82.0 / 95.0));
        REQUIRE(t.duration_s == Catch::Approx(95.0));
        REQUIRE(t.chunk_count == 4);
        REQUIRE(t.missing_count == 0);
        REQUIRE_FALSE(t.incomplete);
        REQUIRE(t.timestamps.empty());
    }

    SECTION("OrderedBySequenceNotArrival") {
        std::map<uint32_t, TranscriptFragment> frags;
        frags.emplace(2, fragment(2, "c", 1.0, 1));
        frags.emplace(0, fragment(0, "a", 1.0, 1));
        frags.emplace(1, fragment(1, "b", 1.0, 1));

        auto t = assembler.assemble("s", frags, {{0, 1}, {1, 1}, {2, 1}});
        REQUIRE(t.full_text == "a b c");
    }

    SECTION("MissingFragmentCountsAsZero") {
        auto frags = by_sequence({fragment(0, "hello", 1.0, 30)});
        std::vector<ChunkInfo> expected{{0, 30}, {1, 10}};

        auto t = assembler.assemble("s", frags, expected);
        REQUIRE(t.full_text == "hello");
        REQUIRE(t.confidence == Catch::Approx(30.0 / 40.0));
        REQUIRE(t.missing_count == 1);
        REQUIRE(t.incomplete);
        REQUIRE(t.duration_s == Catch::Approx(40.0));
    }

    SECTION("AllMissing") {
        auto t = assembler.assemble("s", {}, {{0, 10}});
        REQUIRE(t.full_text.empty());
        REQUIRE(t.confidence == 0.0);
        REQUIRE(t.incomplete);
        REQUIRE(t.chunk_count == 1);
    }

    SECTION("EmptyFragmentsAreSkippedWhenJoining") {
        auto frags = by_sequence({
            fragment(0, "first", 0.9, 10),
            fragment(1, "", 0.0, 10),
            fragment(2, "last", 0.9, 10),
        });

        auto t = assembler.assemble("s", frags, {{0, 10}, {1, 10}, {2, 10}});
        REQUIRE(t.full_text == "first last");
        REQUIRE(t.confidence == Catch::Approx(0.6));
        REQUIRE_FALSE(t.incomplete);
    }

    SECTION("NoChunks") {
        auto t = assembler.assemble("s", {}, std::vector<ChunkInfo>{});
        REQUIRE(t.full_text.empty());
        REQUIRE(t.chunk_count == 0);
        REQUIRE(t.confidence == 0.0);
        REQUIRE_FALSE(t.incomplete);
    }

    SECTION("ExpectedCountOverload") {
        auto frags = by_sequence({fragment(0, "a", 0.5, 2), fragment(2, "c", 1.0, 2)});

        auto t = assembler.assemble("s", frags, size_t(3));
        REQUIRE(t.full_text == "a c");
        REQUIRE(t.chunk_count == 3);
        REQUIRE(t.missing_count == 1);
        REQUIRE(t.incomplete);
        // the missing chunk has no known length, so it carries no weight
        REQUIRE(t.confidence == Catch::Approx(0.75));
    }
}

TEST_CASE("TranscriptAssembler options", "[assembler]") {
    auto frags = by_sequence({fragment(0, "one", 1.0, 30), fragment(1, "two", 1.0, 12.5)});
    std::vector<ChunkInfo> expected{{0, 30}, {1, 12.5}};

    SECTION("CustomSeparator") {
        TranscriptAssembler assembler({.separator = "\n"});
        auto t = assembler.assemble("s", frags, expected);
        REQUIRE(t.full_text == "one\ntwo");
    }

    SECTION("Timestamps") {
        TranscriptAssembler assembler({.timestamps = true});
        auto t = assembler.assemble("s", frags, expected);
        REQUIRE(t.timestamps.size() == 2);
        REQUIRE(t.timestamps[0].sequence == 0);
        REQUIRE(t.timestamps[0].offset_s == Catch::Approx(0.0));
        REQUIRE(t.timestamps[0].duration_s == Catch::Approx(30.0));
        REQUIRE(t.timestamps[1].offset_s == Catch::Approx(30.0));
        REQUIRE(t.timestamps[1].duration_s == Catch::Approx(12.5));
    }
}

TEST_CASE("Transcript fragments", "[assembler]") {
    AudioChunk chunk{.sequence = 4, .samples = std::vector<int16_t>(8), .duration_s = 2.0};

    SECTION("FromResult") {
        TranscriptResult r{.text = "three little words", .confidence = 0.7};
        auto f = make_fragment(chunk, r);
        REQUIRE(f.sequence == 4);
        REQUIRE(f.text == "three little words");
        REQUIRE(f.confidence == Catch::Approx(0.7));
        REQUIRE(f.duration_s == Catch::Approx(2.0));
        REQUIRE(f.speech_rate == Catch::Approx(1.5));
    }

    SECTION("ConfidenceIsClamped") {
        TranscriptResult r{.text = "x", .confidence = 1.4};
        REQUIRE(make_fragment(chunk, r).confidence == 1.0);
    }

    SECTION("FailureBecomesEmptyFragment") {
        std::expected<TranscriptResult, std::string> failed = std::unexpected("timeout");
        auto f = make_fragment(chunk, failed);
        REQUIRE(f.sequence == 4);
        REQUIRE(f.text.empty());
        REQUIRE(f.confidence == 0.0);
        REQUIRE(f.duration_s == Catch::Approx(2.0));
    }

    SECTION("CountWords") {
        REQUIRE(count_words("") == 0);
        REQUIRE(count_words("   ") == 0);
        REQUIRE(count_words("one") == 1);
        REQUIRE(count_words("  one\ttwo \n three  ") == 3);
    }
}
