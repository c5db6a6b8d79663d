#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Backend {
        std::string type = "command";           // "command" or "lan"
        std::string binary = "whisper-cli";
        std::string model = "models/ggml-base.en.bin";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        uint32_t timeout_seconds = 120;
        std::string prompt;                   // initial prompt for every chunk
        std::vector<std::string> vocabulary;  // terms appended to the prompt
        std::string vocabulary_file;          // one term per line
    } backend;

    struct Output {
        std::string default_method = "clipboard"; // "clipboard" or "type"
        bool terminal = false;
    } output;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint16_t channels = 1;
        double chunk_seconds = 30.0;

        // Computed (no independent config key).
        size_t chunk_samples() const {
            return static_cast<size_t>(chunk_seconds * sample_rate) * channels;
        }
    } audio;

    struct Session {
        uint32_t max_seconds = 3600;
        uint32_t autosave_seconds = 300;
        uint32_t finalize_timeout_seconds = 30;
        uint32_t max_parallel_transcriptions = 2;
        std::string separator = " ";
        bool partial_on_abort = false;
        bool timestamps = false;
        uint32_t watchdog_seconds = 0; // 0 disables
    } session;

    struct Hotkey {
        std::string modifier = "ctrl";
        std::string key = "v";
        std::string device; // empty: first keyboard found
    } hotkey;

    struct History {
        bool enabled = true;
        uint32_t retention_days = 90;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
    static Config parse(const std::string& text);
};
