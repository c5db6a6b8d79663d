#include "session/transcript.hpp"

#include <algorithm>
#include <cctype>

TranscriptFragment make_fragment(const AudioChunk& chunk,
                                 const std::expected<TranscriptResult, std::string>& result) {
    TranscriptFragment f{
        .sequence = chunk.sequence,
        .duration_s = chunk.duration_s,
    };
    if (!result) return f;

    f.text = result->text;
    f.confidence = std::clamp(result->confidence, 0.0, 1.0);
    if (chunk.duration_s > 0.0) {
        f.speech_rate = static_cast<double>(count_words(f.text)) / chunk.duration_s;
    }
    return f;
}

size_t count_words(const std::string& text) {
    size_t words = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}
