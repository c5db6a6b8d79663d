#pragma once

#include "session/checkpoint_store.hpp"
#include "session/result_sink.hpp"
#include "session/transcript_assembler.hpp"
#include "whisper/backend.hpp"

#include <expected>
#include <string>

// Finishes sessions interrupted by a crash from their checkpoints. Only chunks
// without a saved fragment are transcribed again.
class SessionRecovery {
public:
    SessionRecovery(CheckpointStore& store, WhisperBackend& backend,
                    AssemblerOptions options = {}, bool verbose = false);

    std::expected<AssembledTranscript, std::string> recover(const std::string& session_id);

    // Delivers each recovered transcript and removes its checkpoint. Checkpoints
    // that cannot be read are left in place. Returns the number recovered.
    size_t recover_all(ResultSink& sink);

private:
    void log(const std::string& msg) const;

    CheckpointStore& store_;
    WhisperBackend& backend_;
    TranscriptAssembler assembler_;
    bool verbose_;
};
