#pragma once

#include "session/transcript.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct AssemblerOptions {
    std::string separator = " ";
    bool timestamps = false;
};

// Joins per-chunk fragments into one transcript, ordered by sequence number.
//
// Confidence is the duration-weighted mean over every expected chunk. A chunk
// with no fragment contributes confidence 0 at its full weight and marks the
// transcript incomplete. Fragments with empty text are skipped when joining.
// No attempt is made to repair words split across chunk boundaries.
class TranscriptAssembler {
public:
    explicit TranscriptAssembler(AssemblerOptions options = {});

    AssembledTranscript assemble(const std::string& session_id,
                                 const std::map<uint32_t, TranscriptFragment>& fragments,
                                 const std::vector<ChunkInfo>& expected) const;

    // Expects sequences 0..expected_count-1; missing fragments carry no known duration.
    AssembledTranscript assemble(const std::string& session_id,
                                 const std::map<uint32_t, TranscriptFragment>& fragments,
                                 size_t expected_count) const;

private:
    AssemblerOptions options_;
};
