#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "whisper/command_backend.hpp"
#include "whisper/lan_backend.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

TEST_CASE("whisper-cli JSON output", "[backend]") {
    SECTION("JoinsSegmentsAndAveragesTokens") {
        auto r = CommandBackend::parse_output(R"({
            "transcription": [
                {"text": " Hello", "tokens": [
                    {"text": "[_BEG_]", "p": 0.1},
                    {"text": " Hello", "p": 0.9}
                ]},
                {"text": " world.", "tokens": [
                    {"text": " world", "p": 0.8},
                    {"text": ".", "p": 0.7},
                    {"text": "[_TT_50]", "p": 0.05}
                ]}
            ]
        })");
        REQUIRE(r.has_value());
        REQUIRE(r->text == "Hello world.");
        REQUIRE(r->confidence == Catch::Approx(0.8));
    }

    SECTION("NoTokensMeansFullConfidence") {
        auto r = CommandBackend::parse_output(R"({"transcription": [{"text": " ok "}]})");
        REQUIRE(r.has_value());
        REQUIRE(r->text == "ok");
        REQUIRE(r->confidence == 1.0);
    }

    SECTION("Silence") {
        auto r = CommandBackend::parse_output(R"({"transcription": []})");
        REQUIRE(r.has_value());
        REQUIRE(r->text.empty());
    }

    SECTION("MissingTranscription") {
        REQUIRE_FALSE(CommandBackend::parse_output(R"({"result": {}})").has_value());
        REQUIRE_FALSE(CommandBackend::parse_output(R"({"transcription": "text"})").has_value());
    }

    SECTION("Garbage") {
        auto r = CommandBackend::parse_output("not json");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().starts_with("JSON parse error"));
    }
}

TEST_CASE("Server verbose_json responses", "[backend]") {
    SECTION("ConfidenceFromAverageLogprob") {
        auto r = LanBackend::parse_response(R"({
            "text": " Two segments here. ",
            "segments": [
                {"text": "Two segments", "avg_logprob": -0.1},
                {"text": "here.", "avg_logprob": -0.5}
            ]
        })");
        REQUIRE(r.has_value());
        REQUIRE(r->text == "Two segments here.");
        REQUIRE(r->confidence == Catch::Approx((std::exp(-0.1) + std::exp(-0.5)) / 2.0));
    }

    SECTION("PlainJsonHasFullConfidence") {
        auto r = LanBackend::parse_response(R"({"text": "hi"})");
        REQUIRE(r.has_value());
        REQUIRE(r->text == "hi");
        REQUIRE(r->confidence == 1.0);
    }

    SECTION("ErrorString") {
        auto r = LanBackend::parse_response(R"({"error": "model not loaded"})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "server error: model not loaded");
    }

    SECTION("ErrorObject") {
        auto r = LanBackend::parse_response(
            R"({"error": {"message": "invalid file", "type": "invalid_request_error"}})");
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error() == "server error: invalid file");
    }

    SECTION("MissingText") {
        REQUIRE_FALSE(LanBackend::parse_response(R"({"segments": []})").has_value());
        REQUIRE_FALSE(LanBackend::parse_response(R"({"text": 5})").has_value());
        REQUIRE_FALSE(LanBackend::parse_response(R"(["text"])").has_value());
    }
}

TEST_CASE("Server requests", "[backend]") {
    using Api = LanBackend::Api;

    SECTION("Endpoints") {
        REQUIRE(LanBackend::endpoint("http://box:8080", Api::WhisperCpp) ==
                "http://box:8080/inference");
        REQUIRE(LanBackend::endpoint("http://box:8080/", Api::OpenAi) ==
                "http://box:8080/v1/audio/transcriptions");
    }

    SECTION("WhisperCppFields") {
        auto fields = LanBackend::form_fields(Api::WhisperCpp, "de");
        using Field = std::pair<std::string, std::string>;
        REQUIRE(fields == std::vector<Field>{
            {"response_format", "verbose_json"}, {"temperature", "0.0"}, {"language", "de"}});
    }

    SECTION("OpenAiFieldsWithoutLanguage") {
        auto fields = LanBackend::form_fields(Api::OpenAi, "");
        using Field = std::pair<std::string, std::string>;
        REQUIRE(fields == std::vector<Field>{
            {"response_format", "verbose_json"}, {"model", "whisper-1"}});
    }

    SECTION("PromptField") {
        auto fields = LanBackend::form_fields(Api::OpenAi, "en", "Kubernetes, Grafana");
        using Field = std::pair<std::string, std::string>;
        REQUIRE(fields == std::vector<Field>{
            {"response_format", "verbose_json"}, {"model", "whisper-1"}, {"language", "en"},
            {"prompt", "Kubernetes, Grafana"}});
    }
}

TEST_CASE("whisper-cli arguments", "[backend]") {
    SECTION("WithoutPrompt") {
        CommandBackend backend("whisper-cli", "m.bin", "en");
        REQUIRE(backend.arguments("/t/chunk.wav", "/t/out") == std::vector<std::string>{
            "whisper-cli", "-m", "m.bin", "-l", "en", "-f", "/t/chunk.wav", "-nt", "-ojf",
            "-of", "/t/out"});
    }

    SECTION("PromptIsOneArgument") {
        CommandBackend backend("whisper-cli", "m.bin", "de", std::chrono::seconds(5),
                               "Meeting notes: Anja, Björn");
        auto args = backend.arguments("/t/chunk.wav", "/t/out");
        REQUIRE(args.size() == 13);
        REQUIRE(args[11] == "--prompt");
        REQUIRE(args[12] == "Meeting notes: Anja, Björn");
    }
}

TEST_CASE("trim_transcript", "[backend]") {
    REQUIRE(trim_transcript("") == "");
    REQUIRE(trim_transcript(" \n\t ") == "");
    REQUIRE(trim_transcript("  a b  ") == "a b");
    REQUIRE(trim_transcript("\nline\r\n") == "line");
}
