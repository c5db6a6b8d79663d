#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>

struct TranscriptResult {
    std::string text;
    double confidence = 1.0; // [0, 1]
    double duration_s = 0.0;
    double processing_s = 0.0;
};

// Speech-to-text engine. Implementations must tolerate concurrent calls.
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate, uint16_t channels) = 0;
    virtual std::string name() const = 0;
};

// Strips leading and trailing whitespace that engines leave around segment text.
inline std::string trim_transcript(const std::string& text) {
    auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}
