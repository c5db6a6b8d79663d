#pragma once

#include "audio/audio_chunk.hpp"
#include "session/transcript.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

// Snapshot of a session in progress, enough to finish it without re-transcribing.
struct Checkpoint {
    std::string session_id;
    int64_t started_at = 0; // unix seconds
    int64_t saved_at = 0;
    std::vector<std::shared_ptr<const AudioChunk>> chunks;
    std::vector<TranscriptFragment> fragments;
};

class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;
    virtual std::expected<void, std::string> save(const Checkpoint& checkpoint) = 0;
    virtual std::expected<Checkpoint, std::string> load(const std::string& session_id) = 0;
    virtual std::vector<std::string> list() = 0;
    virtual void remove(const std::string& session_id) = 0;
};

// One directory per session under root:
//   <root>/<session_id>/checkpoint.json
//   <root>/<session_id>/chunk_000000.wav ...
// Chunk audio is written once; the JSON is replaced atomically on every save.
class JsonCheckpointStore : public CheckpointStore {
public:
    explicit JsonCheckpointStore(std::string root);

    std::expected<void, std::string> save(const Checkpoint& checkpoint) override;
    std::expected<Checkpoint, std::string> load(const std::string& session_id) override;
    std::vector<std::string> list() override;
    void remove(const std::string& session_id) override;

    static constexpr int kFormatVersion = 1;

private:
    std::string root_;
};
