#pragma once

#include "backend.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

// Posts each chunk as a multipart WAV upload to a whisper server on the
// local network, asking for verbose_json so segment log-probabilities are
// available for confidence.
class LanBackend : public WhisperBackend {
public:
    enum class Api {
        WhisperCpp, // whisper.cpp server, POST /inference
        OpenAi,     // OpenAI-compatible, POST /v1/audio/transcriptions
    };

    // api_format is "whisper.cpp" or "openai"; anything else means whisper.cpp.
    LanBackend(std::string url, const std::string& api_format = "whisper.cpp",
               std::string language = "en",
               std::chrono::seconds timeout = std::chrono::seconds(120),
               std::string prompt = {});
    ~LanBackend() override;

    LanBackend(const LanBackend&) = delete;
    LanBackend& operator=(const LanBackend&) = delete;

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate, uint16_t channels) override;
    std::string name() const override { return "lan"; }

    static std::string endpoint(const std::string& base_url, Api api);
    // Text fields sent alongside the audio file.
    static std::vector<std::pair<std::string, std::string>>
        form_fields(Api api, const std::string& language, const std::string& prompt = {});

    // Parses a verbose_json body. Confidence is the mean exp(avg_logprob) over segments.
    static std::expected<TranscriptResult, std::string> parse_response(const std::string& body);

private:
    std::string url_;
    Api api_;
    std::string language_;
    std::chrono::seconds timeout_;
    std::string prompt_;
};
