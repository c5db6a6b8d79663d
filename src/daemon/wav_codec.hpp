#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// In-memory PCM S16LE WAV encoding and decoding.
namespace wav {

struct Decoded {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate,
                                   uint16_t channels = 1) {
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + 44, samples.data(), data_size);
    }

    return out;
}

// Walks the RIFF chunk list, so files with extra chunks (LIST, fact) before "data" still decode.
inline std::expected<Decoded, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };
    auto tag = [&bytes](size_t pos, const char* t) {
        return std::memcmp(bytes.data() + pos, t, 4) == 0;
    };

    if (bytes.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    Decoded out;
    bool have_fmt = false;
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t size = r32(pos + 4);
        size_t body = pos + 8;
        if (body + size > bytes.size()) {
            return std::unexpected("truncated chunk");
        }

        if (tag(pos, "fmt ")) {
            if (size < 16) return std::unexpected("fmt chunk too short");
            if (r16(body) != 1) return std::unexpected("unsupported encoding (not PCM)");
            if (r16(body + 14) != 16) return std::unexpected("unsupported bit depth");
            out.channels = r16(body + 2);
            out.sample_rate = r32(body + 4);
            have_fmt = true;
        } else if (tag(pos, "data")) {
            if (!have_fmt) return std::unexpected("data chunk before fmt chunk");
            out.samples.resize(size / sizeof(int16_t));
            if (!out.samples.empty()) {
                std::memcpy(out.samples.data(), bytes.data() + body,
                            out.samples.size() * sizeof(int16_t));
            }
            return out;
        }

        pos = body + size + (size & 1); // chunks are word aligned
    }

    return std::unexpected("no data chunk");
}

} // namespace wav
