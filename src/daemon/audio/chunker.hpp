#pragma once

#include "audio/audio_chunk.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

// Splits a continuous sample stream into fixed-length AudioChunks numbered from 0.
class Chunker {
public:
    explicit Chunker(ChunkFormat format);

    // Appends samples; returns every chunk completed by them, in order.
    std::vector<AudioChunk> push(std::span<const int16_t> samples);

    // Emits pending samples as the final short chunk. Nothing if no samples are pending.
    std::optional<AudioChunk> flush();

    void reset();

    uint32_t next_sequence() const { return next_sequence_; }
    size_t pending_samples() const { return pending_.size(); }

private:
    AudioChunk make_chunk(std::vector<int16_t> samples, bool is_final);

    ChunkFormat format_;
    size_t chunk_samples_;
    std::vector<int16_t> pending_;
    uint32_t next_sequence_ = 0;
};
