#include "config.hpp"

#include "output/output.hpp"
#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

// Values that would stall the pipeline fall back to their defaults.
void sanitize(Config& cfg) {
    Config defaults;
    if (cfg.audio.chunk_seconds <= 0.0) {
        std::println(stderr, "config: audio.chunk_seconds must be positive, using {}",
                     defaults.audio.chunk_seconds);
        cfg.audio.chunk_seconds = defaults.audio.chunk_seconds;
    }
    if (cfg.audio.sample_rate == 0) cfg.audio.sample_rate = defaults.audio.sample_rate;
    if (cfg.audio.channels == 0) cfg.audio.channels = defaults.audio.channels;
    if (cfg.session.max_parallel_transcriptions == 0) {
        cfg.session.max_parallel_transcriptions = 1;
    }
    if (cfg.session.max_seconds == 0) cfg.session.max_seconds = defaults.session.max_seconds;
    if (!parse_output_kind(cfg.output.default_method)) {
        std::println(stderr, "config: unknown output.default \"{}\", using {}",
                     cfg.output.default_method, defaults.output.default_method);
        cfg.output.default_method = defaults.output.default_method;
    }
}

} // namespace

Config Config::parse(const std::string& text) {
    Config cfg;
    try {
        auto j = json::parse(text);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read_key(b, "type", cfg.backend.type);
            read_key(b, "binary", cfg.backend.binary);
            read_key(b, "model", cfg.backend.model);
            read_key(b, "url", cfg.backend.url);
            read_key(b, "api_format", cfg.backend.api_format);
            read_key(b, "language", cfg.backend.language);
            read_key(b, "timeout_seconds", cfg.backend.timeout_seconds);
            read_key(b, "prompt", cfg.backend.prompt);
            read_key(b, "vocabulary", cfg.backend.vocabulary);
            read_key(b, "vocabulary_file", cfg.backend.vocabulary_file);
        }

        if (j.contains("output")) {
            auto& o = j["output"];
            read_key(o, "default", cfg.output.default_method);
            read_key(o, "terminal", cfg.output.terminal);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read_key(a, "sample_rate", cfg.audio.sample_rate);
            read_key(a, "channels", cfg.audio.channels);
            read_key(a, "chunk_seconds", cfg.audio.chunk_seconds);
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            read_key(s, "max_seconds", cfg.session.max_seconds);
            read_key(s, "autosave_seconds", cfg.session.autosave_seconds);
            read_key(s, "finalize_timeout_seconds", cfg.session.finalize_timeout_seconds);
            read_key(s, "max_parallel_transcriptions", cfg.session.max_parallel_transcriptions);
            read_key(s, "separator", cfg.session.separator);
            read_key(s, "partial_on_abort", cfg.session.partial_on_abort);
            read_key(s, "timestamps", cfg.session.timestamps);
            read_key(s, "watchdog_seconds", cfg.session.watchdog_seconds);
        }

        if (j.contains("hotkey")) {
            auto& h = j["hotkey"];
            read_key(h, "modifier", cfg.hotkey.modifier);
            read_key(h, "key", cfg.hotkey.key);
            read_key(h, "device", cfg.hotkey.device);
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            read_key(h, "enabled", cfg.history.enabled);
            read_key(h, "retention_days", cfg.history.retention_days);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}, using defaults", e.what());
        return Config{};
    }

    sanitize(cfg);
    return cfg;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return Config{};
    }
    std::string text((std::istreambuf_iterator<char>(f)), {});
    return parse(text);
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
