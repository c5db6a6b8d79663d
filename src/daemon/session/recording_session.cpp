#include "session/recording_session.hpp"

#include <algorithm>
#include <ctime>
#include <format>
#include <random>

RecordingSession::RecordingSession(std::string id, Clock::time_point started_at)
    : id_(std::move(id)), started_at_(started_at) {}

std::string RecordingSession::make_id(Clock::time_point at) {
    std::time_t t = Clock::to_time_t(at);
    std::tm tm{};
    localtime_r(&t, &tm);

    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xffffff);

    return std::format("{:04}{:02}{:02}_{:02}{:02}{:02}_{:06x}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, dist(rng));
}

std::expected<RecordingSession::ChunkPtr, std::string> RecordingSession::append(AudioChunk chunk) {
    if (status_ != SessionStatus::Active && status_ != SessionStatus::Finalizing) {
        return std::unexpected(std::format("session is {}", to_string(status_)));
    }
    if (!chunks_.empty() && chunk.sequence <= chunks_.back()->sequence) {
        return std::unexpected(std::format("chunk {} out of order (last was {})",
                                           chunk.sequence, chunks_.back()->sequence));
    }

    elapsed_s_ += chunk.duration_s;
    auto ptr = std::make_shared<const AudioChunk>(std::move(chunk));
    chunks_.push_back(ptr);
    return ptr;
}

bool RecordingSession::record_fragment(TranscriptFragment fragment) {
    bool known = std::ranges::any_of(chunks_, [&](const ChunkPtr& c) {
        return c->sequence == fragment.sequence;
    });
    if (!known) return false;

    return fragments_.emplace(fragment.sequence, std::move(fragment)).second;
}

bool RecordingSession::begin_finalizing() {
    if (status_ != SessionStatus::Active) return false;
    status_ = SessionStatus::Finalizing;
    return true;
}

bool RecordingSession::finalize() {
    if (status_ != SessionStatus::Finalizing) return false;
    status_ = SessionStatus::Finalized;
    return true;
}

bool RecordingSession::abort() {
    if (status_ == SessionStatus::Finalized || status_ == SessionStatus::Aborted) return false;
    status_ = SessionStatus::Aborted;
    return true;
}

std::vector<ChunkInfo> RecordingSession::chunk_infos() const {
    std::vector<ChunkInfo> out;
    out.reserve(chunks_.size());
    for (const auto& c : chunks_) {
        out.push_back({.sequence = c->sequence, .duration_s = c->duration_s});
    }
    return out;
}

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active:     return "active";
        case SessionStatus::Finalizing: return "finalizing";
        case SessionStatus::Finalized:  return "finalized";
        case SessionStatus::Aborted:    return "aborted";
    }
    return "unknown";
}
