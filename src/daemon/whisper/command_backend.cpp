#include "command_backend.hpp"
#include "util/subprocess.hpp"
#include "wav_codec.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Removes the per-call scratch directory on every exit path.
struct ScratchDir {
    std::string path;

    ScratchDir() {
        std::string tmpl = (fs::temp_directory_path() / "holdscribe-XXXXXX").string();
        if (::mkdtemp(tmpl.data())) path = tmpl;
    }
    ~ScratchDir() {
        if (path.empty()) return;
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

} // namespace

CommandBackend::CommandBackend(std::string binary, std::string model, std::string language,
                               std::chrono::seconds timeout, std::string prompt)
    : binary_(std::move(binary)), model_(std::move(model)),
      language_(std::move(language)), timeout_(timeout), prompt_(std::move(prompt)) {}

std::expected<TranscriptResult, std::string>
CommandBackend::transcribe(std::span<const int16_t> audio, uint32_t sample_rate, uint16_t channels) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }

    double duration_s = static_cast<double>(audio.size()) / channels / sample_rate;
    auto start = std::chrono::steady_clock::now();

    ScratchDir dir;
    if (dir.path.empty()) {
        return std::unexpected(std::string("mkdtemp failed: ") + std::strerror(errno));
    }

    std::string wav_path = dir.path + "/chunk.wav";
    std::string base = dir.path + "/out";
    {
        auto bytes = wav::encode(audio, sample_rate, channels);
        std::ofstream out(wav_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return std::unexpected("cannot write " + wav_path);
        }
    }

    auto ran = run(wav_path, base);
    if (!ran) return std::unexpected(ran.error());

    std::ifstream in(base + ".json");
    if (!in.is_open()) {
        return std::unexpected(binary_ + " produced no output file");
    }
    std::string body((std::istreambuf_iterator<char>(in)), {});

    auto result = parse_output(body);
    if (!result) return result;

    result->duration_s = duration_s;
    result->processing_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    return result;
}

std::expected<void, std::string> CommandBackend::run(const std::string& wav_path,
                                                     const std::string& base) {
    return run_process(arguments(wav_path, base), {.timeout = timeout_});
}

std::vector<std::string> CommandBackend::arguments(const std::string& wav_path,
                                                   const std::string& base) const {
    std::vector<std::string> args = {binary_, "-m", model_, "-l", language_, "-f", wav_path,
                                     "-nt", "-ojf", "-of", base};
    if (!prompt_.empty()) {
        args.push_back("--prompt");
        args.push_back(prompt_);
    }
    return args;
}

std::expected<TranscriptResult, std::string> CommandBackend::parse_output(const std::string& json_text) {
    try {
        auto j = json::parse(json_text);
        if (!j.contains("transcription") || !j["transcription"].is_array()) {
            return std::unexpected("missing transcription array");
        }

        std::string text;
        double p_sum = 0.0;
        size_t p_count = 0;
        for (const auto& seg : j["transcription"]) {
            text += seg.value("text", "");
            if (!seg.contains("tokens")) continue;
            for (const auto& tok : seg["tokens"]) {
                // Special tokens such as [_BEG_] carry no speech.
                auto t = tok.value("text", "");
                if (t.starts_with("[_")) continue;
                if (tok.contains("p")) {
                    p_sum += tok["p"].get<double>();
                    ++p_count;
                }
            }
        }

        return TranscriptResult{
            .text = trim_transcript(text),
            .confidence = p_count > 0 ? p_sum / static_cast<double>(p_count) : 1.0,
        };
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
