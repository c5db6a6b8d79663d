#pragma once

#include "audio/audio_chunk.hpp"

#include <expected>
#include <functional>
#include <string>

// Produces fixed-duration chunks in sequence order while started.
//
// Callbacks arrive on a thread owned by the source and must not call back
// into start() or stop().
class AudioChunkSource {
public:
    using ChunkCallback = std::function<void(AudioChunk)>;
    using ErrorCallback = std::function<void(std::string)>;

    virtual ~AudioChunkSource() = default;

    virtual std::expected<void, std::string> start(const ChunkFormat& format,
                                                   ChunkCallback on_chunk,
                                                   ErrorCallback on_fatal) = 0;

    // Flushes the partially recorded buffer as a final short chunk. Returns
    // only after that chunk (if any) has been delivered.
    virtual void stop() = 0;
};
