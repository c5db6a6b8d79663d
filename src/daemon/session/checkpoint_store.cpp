#include "session/checkpoint_store.hpp"

#include "wav_codec.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string chunk_file_name(uint32_t sequence) {
    return std::format("chunk_{:06}.wav", sequence);
}

std::expected<void, std::string> write_atomic(const fs::path& path, const void* data, size_t size) {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected("cannot open " + tmp.string());
        }
        out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!out) {
            return std::unexpected("write failed: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return std::unexpected(std::format("rename to {} failed", path.string()));
    }
    return {};
}

std::expected<std::vector<uint8_t>, std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected("cannot open " + path.string());
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), {});
}

} // namespace

JsonCheckpointStore::JsonCheckpointStore(std::string root)
    : root_(std::move(root)) {}

std::expected<void, std::string> JsonCheckpointStore::save(const Checkpoint& cp) {
    fs::path dir = fs::path(root_) / cp.session_id;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(std::format("cannot create {}: {}", dir.string(), ec.message()));
    }

    json chunks = json::array();
    for (const auto& chunk : cp.chunks) {
        auto name = chunk_file_name(chunk->sequence);
        auto path = dir / name;
        if (!fs::exists(path)) {
            auto bytes = wav::encode(chunk->samples, chunk->sample_rate, chunk->channels);
            auto res = write_atomic(path, bytes.data(), bytes.size());
            if (!res) return res;
        }
        chunks.push_back({
            {"sequence", chunk->sequence},
            {"duration", chunk->duration_s},
            {"is_final", chunk->is_final},
            {"file", name},
        });
    }

    json fragments = json::array();
    for (const auto& f : cp.fragments) {
        fragments.push_back({
            {"sequence", f.sequence},
            {"text", f.text},
            {"confidence", f.confidence},
            {"speech_rate", f.speech_rate},
            {"duration", f.duration_s},
        });
    }

    json doc = {
        {"version", kFormatVersion},
        {"session_id", cp.session_id},
        {"started_at", cp.started_at},
        {"saved_at", cp.saved_at},
        {"chunks", std::move(chunks)},
        {"fragments", std::move(fragments)},
    };

    auto text = doc.dump(2);
    return write_atomic(dir / "checkpoint.json", text.data(), text.size());
}

std::expected<Checkpoint, std::string> JsonCheckpointStore::load(const std::string& session_id) {
    fs::path dir = fs::path(root_) / session_id;
    std::ifstream f(dir / "checkpoint.json");
    if (!f.is_open()) {
        return std::unexpected("no checkpoint for " + session_id);
    }

    Checkpoint cp;
    try {
        auto j = json::parse(f);
        if (j.value("version", 0) != kFormatVersion) {
            return std::unexpected(std::format("unsupported checkpoint version {}",
                                               j.value("version", 0)));
        }
        cp.session_id = j.at("session_id").get<std::string>();
        cp.started_at = j.value("started_at", int64_t{0});
        cp.saved_at = j.value("saved_at", int64_t{0});

        for (const auto& c : j.at("chunks")) {
            auto bytes = read_file(dir / c.at("file").get<std::string>());
            if (!bytes) return std::unexpected(bytes.error());

            auto decoded = wav::decode(*bytes);
            if (!decoded) {
                return std::unexpected(std::format("{}: {}", c.at("file").get<std::string>(),
                                                   decoded.error()));
            }

            cp.chunks.push_back(std::make_shared<const AudioChunk>(AudioChunk{
                .sequence = c.at("sequence").get<uint32_t>(),
                .samples = std::move(decoded->samples),
                .sample_rate = decoded->sample_rate,
                .channels = decoded->channels,
                .duration_s = c.at("duration").get<double>(),
                .is_final = c.value("is_final", false),
            }));
        }

        for (const auto& fr : j.at("fragments")) {
            cp.fragments.push_back({
                .sequence = fr.at("sequence").get<uint32_t>(),
                .text = fr.at("text").get<std::string>(),
                .confidence = fr.at("confidence").get<double>(),
                .speech_rate = fr.value("speech_rate", 0.0),
                .duration_s = fr.value("duration", 0.0),
            });
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::string("checkpoint parse error: ") + e.what());
    }

    std::ranges::sort(cp.chunks, {}, [](const auto& c) { return c->sequence; });
    return cp;
}

std::vector<std::string> JsonCheckpointStore::list() {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) return ids;

    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (entry.is_directory() && fs::exists(entry.path() / "checkpoint.json")) {
            ids.push_back(entry.path().filename().string());
        }
    }
    std::ranges::sort(ids);
    return ids;
}

void JsonCheckpointStore::remove(const std::string& session_id) {
    if (session_id.empty()) return;
    std::error_code ec;
    fs::remove_all(fs::path(root_) / session_id, ec);
    if (ec) {
        std::println(stderr, "checkpoint: failed to remove {}: {}", session_id, ec.message());
    }
}
