#include "audio/chunker.hpp"

#include <algorithm>

Chunker::Chunker(ChunkFormat format)
    : format_(format),
      chunk_samples_(std::max<size_t>(format.samples_per_chunk(), format.channels)) {
    pending_.reserve(chunk_samples_);
}

std::vector<AudioChunk> Chunker::push(std::span<const int16_t> samples) {
    std::vector<AudioChunk> done;

    while (!samples.empty()) {
        size_t take = std::min(samples.size(), chunk_samples_ - pending_.size());
        pending_.insert(pending_.end(), samples.begin(), samples.begin() + take);
        samples = samples.subspan(take);

        if (pending_.size() == chunk_samples_) {
            std::vector<int16_t> full;
            full.reserve(chunk_samples_);
            full.swap(pending_);
            done.push_back(make_chunk(std::move(full), false));
        }
    }

    return done;
}

std::optional<AudioChunk> Chunker::flush() {
    // Drop a trailing partial frame so every chunk holds whole frames.
    pending_.resize(pending_.size() - pending_.size() % format_.channels);
    if (pending_.empty()) return std::nullopt;

    std::vector<int16_t> rest;
    rest.swap(pending_);
    return make_chunk(std::move(rest), true);
}

void Chunker::reset() {
    pending_.clear();
    next_sequence_ = 0;
}

AudioChunk Chunker::make_chunk(std::vector<int16_t> samples, bool is_final) {
    double frames = static_cast<double>(samples.size()) / format_.channels;
    return AudioChunk{
        .sequence = next_sequence_++,
        .samples = std::move(samples),
        .sample_rate = format_.sample_rate,
        .channels = format_.channels,
        .duration_s = frames / format_.sample_rate,
        .is_final = is_final,
    };
}
