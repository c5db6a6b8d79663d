#pragma once

#include "audio/audio_chunk.hpp"
#include "session/transcript.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class SessionStatus { Active, Finalizing, Finalized, Aborted };

const char* to_string(SessionStatus status);

// State of one hold-to-record episode. Not thread-safe: the owning
// SessionController serializes every access.
class RecordingSession {
public:
    using Clock = std::chrono::system_clock;
    using ChunkPtr = std::shared_ptr<const AudioChunk>;

    RecordingSession(std::string id, Clock::time_point started_at);

    // Creation time plus a random suffix, e.g. "20261019_153012_7f3a9c".
    static std::string make_id(Clock::time_point at = Clock::now());

    // Sequence numbers must be strictly increasing. Only accepted while Active or Finalizing.
    std::expected<ChunkPtr, std::string> append(AudioChunk chunk);

    // Returns false for unknown or already transcribed sequences.
    bool record_fragment(TranscriptFragment fragment);

    bool begin_finalizing();
    bool finalize();
    bool abort();

    const std::string& id() const { return id_; }
    Clock::time_point started_at() const { return started_at_; }
    SessionStatus status() const { return status_; }

    const std::vector<ChunkPtr>& chunks() const { return chunks_; }
    const std::map<uint32_t, TranscriptFragment>& fragments() const { return fragments_; }
    std::vector<ChunkInfo> chunk_infos() const;

    // Chunks whose transcription has not come back yet.
    size_t pending() const {
        return chunks_.size() > fragments_.size() ? chunks_.size() - fragments_.size() : 0;
    }

    double elapsed() const { return elapsed_s_; }

    std::optional<Clock::time_point> last_autosave_at() const { return last_autosave_at_; }
    void mark_autosaved(Clock::time_point at) { last_autosave_at_ = at; }

    // Drops audio buffers once the transcript has been handed off.
    void release_audio() { chunks_.clear(); chunks_.shrink_to_fit(); }

private:
    std::string id_;
    Clock::time_point started_at_;
    SessionStatus status_ = SessionStatus::Active;
    std::vector<ChunkPtr> chunks_;
    std::map<uint32_t, TranscriptFragment> fragments_;
    double elapsed_s_ = 0.0;
    std::optional<Clock::time_point> last_autosave_at_;
};
