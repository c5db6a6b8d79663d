#pragma once

#include "audio/audio_chunk.hpp"
#include "whisper/backend.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

// Transcription of a single chunk.
struct TranscriptFragment {
    uint32_t sequence = 0;
    std::string text;
    double confidence = 0.0;
    double speech_rate = 0.0; // words per second
    double duration_s = 0.0;  // audio covered, used as the confidence weight
};

struct FragmentTiming {
    uint32_t sequence = 0;
    double offset_s = 0.0;
    double duration_s = 0.0;
};

// What an assembled transcript is expected to cover.
struct ChunkInfo {
    uint32_t sequence = 0;
    double duration_s = 0.0;
};

struct AssembledTranscript {
    std::string session_id;
    std::string full_text;
    double confidence = 0.0;
    double duration_s = 0.0;
    size_t chunk_count = 0;
    size_t missing_count = 0;
    std::vector<FragmentTiming> timestamps; // empty unless timestamps are enabled
    bool incomplete = false;
    bool recovered = false;
};

// Backend failures become empty zero-confidence fragments.
TranscriptFragment make_fragment(const AudioChunk& chunk,
                                 const std::expected<TranscriptResult, std::string>& result);

size_t count_words(const std::string& text);
