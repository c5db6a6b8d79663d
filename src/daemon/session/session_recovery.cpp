#include "session/session_recovery.hpp"

#include <format>
#include <map>
#include <print>

SessionRecovery::SessionRecovery(CheckpointStore& store, WhisperBackend& backend,
                                 AssemblerOptions options, bool verbose)
    : store_(store), backend_(backend), assembler_(std::move(options)), verbose_(verbose) {}

std::expected<AssembledTranscript, std::string>
SessionRecovery::recover(const std::string& session_id) {
    auto cp = store_.load(session_id);
    if (!cp) return std::unexpected(cp.error());

    std::map<uint32_t, TranscriptFragment> fragments;
    for (auto& f : cp->fragments) {
        fragments.emplace(f.sequence, std::move(f));
    }

    std::vector<ChunkInfo> expected;
    expected.reserve(cp->chunks.size());
    size_t transcribed = 0;
    for (const auto& chunk : cp->chunks) {
        expected.push_back({chunk->sequence, chunk->duration_s});
        if (fragments.contains(chunk->sequence)) continue;

        auto result = backend_.transcribe(chunk->samples, chunk->sample_rate, chunk->channels);
        if (!result) {
            std::println(stderr, "recovery: session {} chunk {} failed: {}",
                         session_id, chunk->sequence, result.error());
        }
        fragments.emplace(chunk->sequence, make_fragment(*chunk, result));
        ++transcribed;
    }

    log(std::format("Recovered session {}: {} chunk(s), {} transcribed now",
                    session_id, expected.size(), transcribed));

    auto transcript = assembler_.assemble(session_id, fragments, expected);
    transcript.recovered = true;
    return transcript;
}

size_t SessionRecovery::recover_all(ResultSink& sink) {
    size_t recovered = 0;
    for (const auto& id : store_.list()) {
        auto transcript = recover(id);
        if (!transcript) {
            std::println(stderr, "recovery: skipping {}: {}", id, transcript.error());
            continue;
        }
        sink.deliver(*transcript);
        store_.remove(id);
        ++recovered;
    }
    return recovered;
}

void SessionRecovery::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[holdscribe] {}", msg);
    }
}
