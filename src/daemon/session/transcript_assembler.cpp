#include "session/transcript_assembler.hpp"

TranscriptAssembler::TranscriptAssembler(AssemblerOptions options)
    : options_(std::move(options)) {}

AssembledTranscript TranscriptAssembler::assemble(
        const std::string& session_id,
        const std::map<uint32_t, TranscriptFragment>& fragments,
        const std::vector<ChunkInfo>& expected) const {
    AssembledTranscript out{
        .session_id = session_id,
        .chunk_count = expected.size(),
    };

    double weighted = 0.0;
    double total_weight = 0.0;
    double plain_sum = 0.0;
    size_t present = 0;
    double offset = 0.0;

    for (const auto& chunk : expected) {
        auto it = fragments.find(chunk.sequence);
        double weight = chunk.duration_s;

        if (it == fragments.end()) {
            ++out.missing_count;
        } else {
            const auto& frag = it->second;
            if (weight <= 0.0) weight = frag.duration_s;
            weighted += frag.confidence * weight;
            plain_sum += frag.confidence;
            ++present;

            if (!frag.text.empty()) {
                if (!out.full_text.empty()) out.full_text += options_.separator;
                out.full_text += frag.text;
            }
        }

        total_weight += weight;
        if (options_.timestamps) {
            out.timestamps.push_back({
                .sequence = chunk.sequence,
                .offset_s = offset,
                .duration_s = weight,
            });
        }
        offset += weight;
    }

    out.duration_s = offset;
    if (total_weight > 0.0) {
        out.confidence = weighted / total_weight;
    } else if (present > 0) {
        out.confidence = plain_sum / static_cast<double>(present);
    }
    out.incomplete = out.missing_count > 0;
    return out;
}

AssembledTranscript TranscriptAssembler::assemble(
        const std::string& session_id,
        const std::map<uint32_t, TranscriptFragment>& fragments,
        size_t expected_count) const {
    std::vector<ChunkInfo> expected;
    expected.reserve(expected_count);
    for (size_t i = 0; i < expected_count; ++i) {
        auto seq = static_cast<uint32_t>(i);
        auto it = fragments.find(seq);
        expected.push_back({
            .sequence = seq,
            .duration_s = it != fragments.end() ? it->second.duration_s : 0.0,
        });
    }
    return assemble(session_id, fragments, expected);
}
