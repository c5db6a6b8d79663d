#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct ChunkFormat {
    double chunk_seconds = 30.0;
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;

    size_t samples_per_chunk() const {
        return static_cast<size_t>(chunk_seconds * sample_rate) * channels;
    }
};

// One bounded slice of interleaved S16 PCM audio.
struct AudioChunk {
    uint32_t sequence = 0;
    std::vector<int16_t> samples;
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
    double duration_s = 0.0;
    bool is_final = false; // produced by stop(), usually shorter than a full chunk
};
