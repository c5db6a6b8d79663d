#pragma once

#include "backend.hpp"

#include <chrono>
#include <string>
#include <vector>

// Runs a local whisper.cpp CLI once per chunk:
//   whisper-cli -m MODEL -l LANG -f FILE -nt -ojf -of BASE [--prompt TEXT]
// and reads BASE.json.
class CommandBackend : public WhisperBackend {
public:
    CommandBackend(std::string binary, std::string model, std::string language = "en",
                   std::chrono::seconds timeout = std::chrono::seconds(120),
                   std::string prompt = {});

    std::expected<TranscriptResult, std::string>
        transcribe(std::span<const int16_t> audio, uint32_t sample_rate, uint16_t channels) override;
    std::string name() const override { return "command"; }

    // Parses the -ojf output. Confidence is the mean token probability.
    static std::expected<TranscriptResult, std::string> parse_output(const std::string& json_text);

    std::vector<std::string> arguments(const std::string& wav_path, const std::string& base) const;

private:
    std::expected<void, std::string> run(const std::string& wav_path, const std::string& base);

    std::string binary_;
    std::string model_;
    std::string language_;
    std::chrono::seconds timeout_;
    std::string prompt_;
};
